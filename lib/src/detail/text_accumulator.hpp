#pragma once
#include <detail/token.hpp>
#include <string>

namespace sj::detail {
/// \brief Assembles the text of a string or bare literal.
/// Escape sequences are kept verbatim: a backslash is buffered together with the token following it.
class TextAccumulator {
  public:
	void accumulate(Token const token) {
		if (token.type == TokenType::Backslash) {
			if (m_escaping) {
				m_text.append(R"(\\)");
				m_escaping = false;
			} else {
				m_escaping = true;
			}
			return;
		}
		if (m_escaping) {
			m_text.push_back('\\');
			m_escaping = false;
		}
		m_text.push_back(token.ch);
	}

	/// \brief Obtain the accumulated text and clear the buffer (retaining its storage).
	[[nodiscard]] auto pop() -> std::string {
		auto ret = m_text;
		m_text.clear();
		m_escaping = false;
		return ret;
	}

	/// \brief Drop the accumulated text and free its storage.
	void release() {
		m_text = {};
		m_escaping = false;
	}

	[[nodiscard]] auto view() const -> std::string_view { return m_text; }
	[[nodiscard]] auto is_escaping() const -> bool { return m_escaping; }

  private:
	std::string m_text{};
	bool m_escaping{};
};
} // namespace sj::detail
