#include <sjson/streamer.hpp>
#include <documents.hpp>
#include <event_log.hpp>
#include <unit_test.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
using sj::Error;
using sj::JsonStreamer;
using sj::StreamEvent;
using sj::StreamOptions;
using sj::test::EventLog;

auto count_events(std::string_view text, std::size_t const split = 0) -> std::size_t {
	auto ret = std::size_t{};
	auto streamer = JsonStreamer{};
	streamer.add_catch_all_listener([&ret](StreamEvent, sj::Json const&) { ++ret; });
	if (split > 0) {
		if (!streamer.consume(text.substr(0, split))) { return 0; }
		text.remove_prefix(split);
	}
	if (!streamer.consume(text)) { return 0; }
	return ret;
}

auto consume_error(JsonStreamer& streamer, std::string_view const text) -> Error {
	auto const result = streamer.consume(text);
	if (result) { return Error{}; }
	return result.error();
}

TEST(streamer_event_counts) {
	EXPECT(count_events(sj::test::doc::employees_v, 20) == 26);
	EXPECT(count_events(sj::test::doc::nested_v) == 29);
	EXPECT(count_events(sj::test::doc::mixed_array_v) == 10);
	EXPECT(count_events(sj::test::doc::glossary_v) == 41);
	EXPECT(count_events(sj::test::doc::product_v) == 88);
}

TEST(streamer_event_sequence) {
	auto log = EventLog{};
	auto streamer = JsonStreamer{};
	log.attach(streamer);
	ASSERT(streamer.consume(R"({"a": [1, "x"], "b": {"c": null}})"));
	streamer.close();
	auto const expected = std::vector<std::string>{
		"doc_start",
		"object_start",
		"key:a",
		"array_start",
		"element:1",
		"element:x",
		"array_end",
		"key:b",
		"object_start",
		"key:c",
		"value:null",
		"object_end",
		"object_end",
		"doc_end",
	};
	EXPECT(log.entries == expected);
}

TEST(streamer_named_listeners) {
	auto streamer = JsonStreamer{};
	auto keys = std::vector<std::string>{};
	auto values = std::vector<std::string>{};
	streamer.add_listener(StreamEvent::Key, [&keys](sj::Json const& key) { keys.emplace_back(key.as_string_view()); });
	streamer.add_listener(StreamEvent::Value, [&values](sj::Json const& value) { values.push_back(EventLog::describe(value)); });
	ASSERT(streamer.consume(R"({"first Name": "Jo:hn", "lastName": "Doe,Foe", "ok": true})"));
	EXPECT((keys == std::vector<std::string>{"first Name", "lastName", "ok"}));
	EXPECT((values == std::vector<std::string>{"Jo:hn", "Doe,Foe", "true"}));
}

TEST(streamer_close_is_idempotent) {
	auto log = EventLog{};
	auto streamer = JsonStreamer{};
	log.attach(streamer);
	ASSERT(streamer.consume(R"({"key": "value"})"));
	streamer.close();
	streamer.close();
	EXPECT(streamer.is_closed());
	EXPECT(log.count("doc_start") == 1);
	EXPECT(log.count("doc_end") == 1);

	auto const logger = sj::test::SilentLogger{};
	EXPECT(consume_error(streamer, "{}").type == Error::Type::StreamClosed);
	EXPECT(log.count("doc_start") == 1);
}

TEST(streamer_destructor_closes) {
	auto log = EventLog{};
	{
		auto streamer = JsonStreamer{};
		log.attach(streamer);
		ASSERT(streamer.consume(R"({"key": "val)"));
	}
	EXPECT(log.entries.back() == "doc_end");
	EXPECT(log.count("value:val") == 0);
}

TEST(streamer_number_typing) {
	auto streamer = JsonStreamer{};
	auto elements = std::vector<sj::Json>{};
	streamer.add_listener(StreamEvent::Element, [&elements](sj::Json const& value) { elements.push_back(value); });
	ASSERT(streamer.consume("[-123, -12.5, 1e10, 0, -0.5, +7]"));
	ASSERT(elements.size() == 6);
	EXPECT(elements[0].is_integer() && elements[0].as_i64() == -123);
	EXPECT(!elements[1].is_integer() && elements[1].as_double() == -12.5);
	EXPECT(!elements[2].is_integer() && elements[2].as_double() == 1e10);
	EXPECT(elements[3].is_integer() && elements[3].as_i64() == 0);
	EXPECT(!elements[4].is_integer() && elements[4].as_double() == -0.5);
	EXPECT(elements[5].is_integer() && elements[5].as_i64() == 7);
}

TEST(streamer_incomplete_input_continues) {
	auto log = EventLog{};
	auto streamer = JsonStreamer{};
	log.attach(streamer);
	ASSERT(streamer.consume(R"({"key": "val)"));
	EXPECT(log.count("value:value") == 0);
	ASSERT(streamer.consume(R"(ue"})"));
	EXPECT(log.count("value:value") == 1);
	EXPECT(streamer.get_depth() == 0);
}

TEST(streamer_buffer_size) {
	auto const text = R"({"key": ")" + std::string(200, 'x') + R"("})";
	for (auto const buffer_size : {std::size_t{1}, std::size_t{7}, std::size_t{128}, std::size_t{0}}) {
		auto log = EventLog{};
		auto streamer = JsonStreamer{StreamOptions{.buffer_size = buffer_size}};
		log.attach(streamer);
		ASSERT(streamer.consume(text));
		streamer.close();
		EXPECT(log.count("value:" + std::string(200, 'x')) == 1);
		EXPECT(log.count("doc_end") == 1);
	}
}

TEST(streamer_depth_limit) {
	auto const logger = sj::test::SilentLogger{};
	constexpr auto deep_object = R"({"a": {"b": {"c": {"d": 1}}}})";

	auto limited = JsonStreamer{StreamOptions{.max_depth = 3}};
	EXPECT(limited.get_options().max_depth == 3);
	EXPECT(!limited.get_options().max_string_size);
	auto const error = consume_error(limited, deep_object);
	EXPECT(error.type == Error::Type::DepthExceeded);
	EXPECT(sj::is_limit_error(error));
	EXPECT(error.limit == 3 && error.actual == 4);

	auto exact = JsonStreamer{StreamOptions{.max_depth = 4}};
	EXPECT(exact.consume(deep_object));

	auto unlimited = JsonStreamer{};
	EXPECT(unlimited.consume(deep_object));

	auto arrays = JsonStreamer{StreamOptions{.max_depth = 3}};
	EXPECT(consume_error(arrays, "[[[[1]]]]").type == Error::Type::DepthExceeded);
	EXPECT(sj::test::SilentLogger::count == 2);
}

TEST(streamer_string_limit) {
	auto const logger = sj::test::SilentLogger{};

	auto value = JsonStreamer{StreamOptions{.max_string_size = 10}};
	auto error = consume_error(value, R"({"key": "this_string_is_way_too_long"})");
	EXPECT(error.type == Error::Type::StringSizeExceeded);
	EXPECT(error.limit == 10 && error.actual == 27);

	auto key = JsonStreamer{StreamOptions{.max_string_size = 5}};
	EXPECT(consume_error(key, R"({"very_long_key_name": "value"})").type == Error::Type::StringSizeExceeded);

	auto element = JsonStreamer{StreamOptions{.max_string_size = 3}};
	EXPECT(consume_error(element, R"(["abcd"])").type == Error::Type::StringSizeExceeded);

	auto exact = JsonStreamer{StreamOptions{.max_string_size = 5}};
	EXPECT(exact.consume(R"({"key": "value"})"));

	// counted in code points: five two-byte characters
	auto utf8 = JsonStreamer{StreamOptions{.max_string_size = 5}};
	EXPECT(utf8.consume("[\"\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\"]"));
}

TEST(streamer_grammar_errors) {
	auto const logger = sj::test::SilentLogger{};
	struct Case {
		std::string_view text{};
		Error::Type expected{};
	};
	auto const cases = std::array{
		Case{.text = "{invalid json}", .expected = Error::Type::UnexpectedToken},
		Case{.text = R"({"a":[1})", .expected = Error::Type::MismatchedBracket},
		Case{.text = R"([{"a":1]])", .expected = Error::Type::MismatchedBracket},
		Case{.text = R"({"a":1,2})", .expected = Error::Type::MissingKey},
		Case{.text = R"({"a":1,{}})", .expected = Error::Type::MissingKey},
		Case{.text = R"({{}})", .expected = Error::Type::MissingKey},
		Case{.text = R"({"a"})", .expected = Error::Type::MissingColon},
		Case{.text = R"({"a","b"})", .expected = Error::Type::MissingColon},
		Case{.text = R"(["a":1])", .expected = Error::Type::UnexpectedToken},
		Case{.text = R"({"a":"b":"c"})", .expected = Error::Type::UnexpectedToken},
		Case{.text = R"({"a":1,})", .expected = Error::Type::UnexpectedToken},
		Case{.text = R"([1,])", .expected = Error::Type::UnexpectedToken},
		Case{.text = R"([nul])", .expected = Error::Type::InvalidLiteral},
		Case{.text = R"([1e999])", .expected = Error::Type::InvalidNumber},
	};
	for (auto const& test_case : cases) {
		auto streamer = JsonStreamer{};
		auto const error = consume_error(streamer, test_case.text);
		if (error.type != test_case.expected) { std::cerr << "  input: " << test_case.text << " -> " << sj::to_string(error) << '\n'; }
		EXPECT(error.type == test_case.expected);
	}
	EXPECT(sj::test::SilentLogger::count == int(cases.size()));
}

TEST(streamer_poisoned_after_fault) {
	auto const logger = sj::test::SilentLogger{};
	auto log = EventLog{};
	auto streamer = JsonStreamer{};
	log.attach(streamer);
	auto const first = consume_error(streamer, R"({"a":1]})");
	EXPECT(first.type == Error::Type::MismatchedBracket);
	EXPECT(first.token == "]");
	EXPECT((first.src_loc == sj::SrcLoc{.line = 1, .column = 7}));

	auto const size = log.entries.size();
	auto const second = consume_error(streamer, R"({"b":2})");
	EXPECT(second.type == first.type && second.src_loc == first.src_loc);
	EXPECT(log.entries.size() == size);
	// the fault is reported once
	EXPECT(sj::test::SilentLogger::count == 1);

	streamer.close();
	EXPECT(log.entries.back() == "doc_end");
}

TEST(streamer_multiple_documents) {
	auto log = EventLog{};
	auto streamer = JsonStreamer{};
	log.attach(streamer);
	ASSERT(streamer.consume(R"({"a":1} {"b":2})"));
	streamer.close();
	EXPECT(log.count("doc_start") == 1);
	EXPECT(log.count("object_start") == 2);
	EXPECT(log.count("object_end") == 2);
	EXPECT(log.count("doc_end") == 1);
}

TEST(streamer_error_message) {
	auto const logger = sj::test::SilentLogger{};
	auto streamer = JsonStreamer{};
	auto const error = consume_error(streamer, "{\n:");
	EXPECT(sj::to_string(error) == "Unexpected token - ':' in state 'object_start' [2:1]");

	auto limited = JsonStreamer{StreamOptions{.max_depth = 1}};
	EXPECT(sj::to_string(consume_error(limited, "[[")) == "Maximum nesting depth exceeded - '[' (limit: 1, got: 2) [1:2]");
}

TEST(streamer_listener_exception_poisons) {
	auto elements = std::vector<std::int64_t>{};
	auto streamer = JsonStreamer{};
	streamer.add_listener(StreamEvent::Element, [&elements](sj::Json const& value) {
		if (value.as_i64() == 2) { throw std::runtime_error{"listener failure"}; }
		elements.push_back(value.as_i64());
	});

	auto thrown = false;
	try {
		static_cast<void>(streamer.consume("[1,2,3"));
	} catch (std::runtime_error const&) { thrown = true; }
	EXPECT(thrown);
	EXPECT(elements.size() == 1);

	auto const first = consume_error(streamer, "]");
	EXPECT(first.type == Error::Type::Unknown);
	auto const second = consume_error(streamer, "[4]");
	EXPECT(second.type == Error::Type::Unknown && second.src_loc == first.src_loc);
	EXPECT(elements.size() == 1);
	EXPECT(streamer.get_depth() == 1);
}
} // namespace
