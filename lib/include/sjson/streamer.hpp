#pragma once
#include <sjson/error.hpp>
#include <sjson/event_source.hpp>
#include <sjson/json.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace sj {
/// \brief Events fired by JsonStreamer.
enum class StreamEvent : std::int8_t { DocStart, DocEnd, ObjectStart, ObjectEnd, ArrayStart, ArrayEnd, Key, Value, Element, COUNT_ };

/// \brief Obtain the canonical name of an event ("doc_start", "key", ...).
auto to_string_view(StreamEvent event) -> std::string_view;

/// \brief Streamer configuration.
struct StreamOptions {
	/// \brief Size of the slices handed to the lexer. Has no effect on the events produced.
	std::size_t buffer_size{64 * 1024};
	/// \brief Maximum number of simultaneously open containers (unlimited if unset).
	std::optional<std::size_t> max_depth{};
	/// \brief Maximum length of keys and string values in UTF-8 code points (unlimited if unset).
	std::optional<std::size_t> max_string_size{};
};

/// \brief Push-style JSON parser.
/// Feed chunks of a document (or of a sequence of whitespace separated documents) to consume(),
/// in any partitioning. Events are fired synchronously as soon as each token is recognized.
/// Structural events carry a null payload, Key carries a string, Value and Element carry a scalar.
/// DocStart is fired on the first consume(), DocEnd on close().
/// Listeners must not call consume() or close() on the streamer dispatching to them.
/// The destructor calls close(), which fires DocEnd: listeners (and anything they capture) must outlive the streamer,
/// and must not throw on DocEnd.
class JsonStreamer : public EventSource<StreamEvent, Json const&> {
  public:
	explicit JsonStreamer(StreamOptions const& options = {});
	~JsonStreamer();

	JsonStreamer(JsonStreamer const&) = delete;
	JsonStreamer(JsonStreamer&&) = delete;
	auto operator=(JsonStreamer const&) -> JsonStreamer& = delete;
	auto operator=(JsonStreamer&&) -> JsonStreamer& = delete;

	/// \brief Feed the next chunk of input.
	/// \param data Chunk of text, may split tokens anywhere.
	/// \returns Error on malformed input, violated limit, or if closed.
	/// Once an error is returned every subsequent call returns the same error.
	/// An exception thrown by a listener propagates out of consume() and leaves the streamer faulted with Error::Type::Unknown.
	[[nodiscard]] auto consume(std::string_view data) -> Result;

	/// \brief Fire DocEnd and release all buffers. Subsequent calls are no-ops.
	void close();

	[[nodiscard]] auto is_closed() const -> bool;
	[[nodiscard]] auto get_options() const -> StreamOptions const&;
	/// \brief Number of containers currently open.
	[[nodiscard]] auto get_depth() const -> std::size_t;

  private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};
} // namespace sj
