#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace sj::detail {
/// \brief Unread input: written at the back, read from the front.
class Tape {
  public:
	/// \brief Append text. Storage of fully read input is reclaimed first.
	auto write(std::string_view const text) -> std::size_t {
		if (m_read == m_buffer.size()) {
			m_buffer.clear();
			m_read = 0;
		} else if (m_read > 0) {
			m_buffer.erase(0, m_read);
			m_read = 0;
		}
		m_buffer.append(text);
		return text.size();
	}

	/// \brief Read up to size characters from the front.
	/// The returned view is valid until the next write() or release().
	[[nodiscard]] auto read(std::size_t const size) -> std::string_view {
		auto const ret = std::string_view{m_buffer}.substr(m_read, size);
		m_read += ret.size();
		return ret;
	}

	/// \brief Unread input.
	[[nodiscard]] auto view() const -> std::string_view { return std::string_view{m_buffer}.substr(m_read); }
	[[nodiscard]] auto size() const -> std::size_t { return m_buffer.size() - m_read; }
	[[nodiscard]] auto is_empty() const -> bool { return size() == 0; }

	/// \brief Drop all input and free storage.
	void release() {
		m_buffer = {};
		m_read = 0;
	}

  private:
	std::string m_buffer{};
	std::size_t m_read{};
};
} // namespace sj::detail
