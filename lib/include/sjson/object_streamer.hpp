#pragma once
#include <sjson/streamer.hpp>
#include <string>
#include <vector>

namespace sj {
/// \brief Events fired by ObjectStreamer.
enum class ObjectEvent : std::int8_t { ObjectStreamStart, ObjectStreamEnd, ArrayStreamStart, ArrayStreamEnd, Pair, Element, COUNT_ };

/// \brief Obtain the canonical name of an event ("object_stream_start", "pair", ...).
auto to_string_view(ObjectEvent event) -> std::string_view;

/// \brief Streams the direct members of a root container as complete values.
/// Pair is fired for every key/value of a root object, Element for every element of a root array.
/// Nested containers are reassembled and delivered once they close.
/// Only the key is non-empty, and only for Pair; stream start/end events carry a null value.
class ObjectStreamer : public EventSource<ObjectEvent, std::string_view, Json const&> {
  public:
	explicit ObjectStreamer(StreamOptions const& options = {});
	~ObjectStreamer();

	ObjectStreamer(ObjectStreamer const&) = delete;
	ObjectStreamer(ObjectStreamer&&) = delete;
	auto operator=(ObjectStreamer const&) -> ObjectStreamer& = delete;
	auto operator=(ObjectStreamer&&) -> ObjectStreamer& = delete;

	/// \brief Feed the next chunk of input. Same contract as JsonStreamer::consume().
	[[nodiscard]] auto consume(std::string_view data) -> Result;

	/// \brief Close the underlying streamer and drop any partially built values.
	void close();

	[[nodiscard]] auto is_closed() const -> bool { return m_streamer.is_closed(); }

  private:
	void on_event(StreamEvent event, Json const& payload);
	void reset();
	void open(JsonType type);
	void close_container(JsonType type);
	void on_value(Json const& value);
	void on_element(Json const& value);
	void attach(Json value);
	auto pop_key() -> std::string;

	JsonStreamer m_streamer;
	std::optional<JsonType> m_root{};
	std::vector<Json> m_containers{};
	std::vector<std::string> m_keys{};
};
} // namespace sj
