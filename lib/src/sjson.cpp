#include <detail/lexer.hpp>
#include <detail/logger.hpp>
#include <detail/tape.hpp>
#include <detail/tokenizer.hpp>
#include <detail/value.hpp>
#include <sjson/object_streamer.hpp>
#include <sjson/streamer.hpp>
#include <algorithm>
#include <charconv>
#include <iostream>
#include <mutex>
#include <utility>

// error

namespace sj {
namespace {
using namespace std::string_view_literals;

constexpr auto error_type_str_v = std::array{
	"Unknown error"sv,
	"Unexpected token"sv,
	"Invalid literal"sv,
	"Invalid number"sv,
	"Missing key"sv,
	"Missing colon (':')"sv,
	"Mismatched bracket"sv,
	"Maximum nesting depth exceeded"sv,
	"Maximum string size exceeded"sv,
	"Stream closed"sv,
};

static_assert(error_type_str_v.size() == std::size_t(Error::Type::COUNT_));

std::mutex g_logger_mutex{}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
ErrorLogger g_error_logger{&log_to_stderr}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
} // namespace
} // namespace sj

auto sj::to_string_view(Error::Type const type) -> std::string_view {
	if (int(type) < 0 || type >= Error::Type::COUNT_) { return sj::error_type_str_v[std::size_t(Error::Type::Unknown)]; }
	return sj::error_type_str_v.at(std::size_t(type));
}

auto sj::to_string(Error const& error) -> std::string {
	auto ret = std::string{to_string_view(error.type)};
	if (!error.token.empty()) { ret.append(" - '").append(error.token).append("'"); }
	if (!error.state.empty()) { ret.append(" in state '").append(error.state).append("'"); }
	if (is_limit_error(error)) {
		ret.append(" (limit: ").append(std::to_string(error.limit)).append(", got: ").append(std::to_string(error.actual)).append(")");
	}
	auto const src_loc = error.src_loc;
	if (src_loc.line > 0 && src_loc.column > 0) {
		ret.append(" [").append(std::to_string(src_loc.line)).append(":").append(std::to_string(src_loc.column)).append("]");
	}
	return ret;
}

void sj::log_to_stderr(Error const& error) { std::cerr << "[sjson] Error: " << to_string(error) << std::endl; }

void sj::set_error_logger(ErrorLogger const logger) {
	auto lock = std::scoped_lock{g_logger_mutex};
	g_error_logger = logger;
}

void sj::detail::log_error(Error const& error) {
	auto lock = std::scoped_lock{g_logger_mutex};
	if (g_error_logger != nullptr) { g_error_logger(error); }
}

// lexer

namespace sj::detail {
namespace {
auto const no_literal_v = Literal{};

[[nodiscard]] auto describe(Token const token) -> std::string {
	if (is_blank(token.type)) { return std::string{to_string_view(token.type)}; }
	return std::string(1, token.ch);
}

[[nodiscard]] constexpr auto collects_text(LexerState const from, LexerState const to) -> bool {
	switch (to) {
	case LexerState::Literal:
	case LexerState::StringEscaping: return true;
	case LexerState::StringStart: return from == LexerState::StringStart || from == LexerState::StringEscaping;
	default: return false;
	}
}

[[nodiscard]] constexpr auto to_lex_event(LexerState const state) -> LexEvent {
	switch (state) {
	case LexerState::ObjectStart: return LexEvent::ObjectStart;
	case LexerState::ObjectEnd: return LexEvent::ObjectEnd;
	case LexerState::ArrayStart: return LexEvent::ArrayStart;
	default: return LexEvent::ArrayEnd;
	}
}
} // namespace

auto to_number(std::string_view text, Json& out) -> bool {
	if (text.starts_with('+')) { text.remove_prefix(1); }
	auto const* first = text.data();
	auto const* last = first + text.size();
	if (is_integer_literal(text)) {
		auto i64 = std::int64_t{};
		auto const [i_ptr, i_ec] = std::from_chars(first, last, i64);
		if (i_ec == std::errc{} && i_ptr == last) {
			out.set_number(i64);
			return true;
		}
		if (i_ec != std::errc::result_out_of_range || text.starts_with('-')) { return false; }
		auto u64 = std::uint64_t{};
		auto const [u_ptr, u_ec] = std::from_chars(first, last, u64);
		if (u_ec != std::errc{} || u_ptr != last) { return false; }
		out.set_number(u64);
		return true;
	}
	auto f64 = double{};
	auto const [ptr, ec] = std::from_chars(first, last, f64);
	if (ec != std::errc{} || ptr != last) { return false; }
	out.set_number(f64);
	return true;
}

auto Lexer::consume(std::string_view const chunk) -> Result {
	try {
		if (m_closed) { throw Error{.type = Error::Type::StreamClosed, .src_loc = m_src_loc}; }
		Tokenizer::consume(chunk, [this](Token const token) { on_token(token); });
	} catch (Error const& error) { return std::unexpected(error); }
	return {};
}

void Lexer::close() {
	if (m_closed) { return; }
	m_closed = true;
	m_text.release();
	if (m_state == LexerState::New || m_state == LexerState::DocEnd) { return; }
	drive(TokenType::End, Token{.type = TokenType::End});
}

void Lexer::on_token(Token const token) {
	advance_src_loc(token.ch);
	if (m_state == LexerState::New && !m_started && !is_blank(token.type)) {
		m_started = true;
		drive(TokenType::Start, token);
	}
	drive(token.type, token);
}

void Lexer::drive(TokenType const signal, Token const token) {
	auto const from = m_state;
	auto const transition = transition_table_v.at(from, signal);
	switch (transition.action) {
	case Action::Fault: throw make_error(Error::Type::UnexpectedToken, describe(token));
	case Action::Ignore:
		// whitespace terminates a bare literal
		if (from == LexerState::Literal) { m_literal_done = true; }
		return;
	case Action::Loop:
		if (from == LexerState::Literal && m_literal_done) { throw make_error(Error::Type::UnexpectedToken, describe(token)); }
		break;
	case Action::Transit: break;
	}

	enter(from, transition.target, token.ch);
	if (collects_text(from, transition.target)) { m_text.accumulate(token); }
}

void Lexer::enter(LexerState const from, LexerState const to, char const trigger) {
	if (from == LexerState::Literal && to != LexerState::Literal && to != LexerState::DocEnd) { emit_literal(); }
	m_state = to;

	switch (to) {
	case LexerState::New:
		m_started = false;
		m_separator = '\0';
		break;
	case LexerState::DocStart: fire(LexEvent::DocStart, no_literal_v); break;
	case LexerState::DocEnd:
		m_depth = 0;
		fire(LexEvent::DocEnd, no_literal_v);
		drive(TokenType::Reset, Token{.type = TokenType::Reset});
		break;
	case LexerState::ObjectStart:
	case LexerState::ArrayStart:
		++m_depth;
		fire(to_lex_event(to), no_literal_v);
		m_separator = '\0';
		break;
	case LexerState::ObjectEnd:
	case LexerState::ArrayEnd:
		if (m_depth > 0) { --m_depth; }
		fire(to_lex_event(to), no_literal_v);
		if (m_depth == 0) { drive(TokenType::End, Token{.type = TokenType::End}); }
		break;
	case LexerState::StringEnd: emit_string(); break;
	case LexerState::Literal:
		if (from != LexerState::Literal) { m_literal_done = false; }
		break;
	case LexerState::More: m_separator = trigger; break;
	case LexerState::StringStart:
	case LexerState::StringEscaping:
	case LexerState::COUNT_: break;
	}
}

void Lexer::emit_string() {
	auto const text = m_text.pop();
	fire(LexEvent::Literal, Literal{.type = LiteralType::String, .value = Json{text}, .text = text});
}

void Lexer::emit_literal() {
	auto const text = m_text.pop();
	auto literal = Literal{.text = text};
	if (is_number_literal(text)) {
		literal.type = LiteralType::Number;
		if (!to_number(text, literal.value)) { throw make_error(Error::Type::InvalidNumber, text); }
	} else if (text == "true" || text == "false") {
		literal.type = LiteralType::Boolean;
		literal.value.set_boolean(text == "true");
	} else if (text == "null") {
		literal.type = LiteralType::Null;
	} else {
		throw make_error(Error::Type::InvalidLiteral, text);
	}
	fire(LexEvent::Literal, literal);
}

void Lexer::advance_src_loc(char const c) {
	m_src_loc = m_next_loc;
	if (c == '\n') {
		++m_next_loc.line;
		m_next_loc.column = 1;
	} else {
		++m_next_loc.column;
	}
}

auto Lexer::make_error(Error::Type const type, std::string token) const -> Error {
	return Error{
		.type = type,
		.token = std::move(token),
		.state = to_string_view(m_state),
		.src_loc = m_src_loc,
	};
}
} // namespace sj::detail

// streamer

namespace sj {
namespace {
using namespace std::string_view_literals;

constexpr auto stream_event_str_v = std::array{
	"doc_start"sv, "doc_end"sv, "object_start"sv, "object_end"sv, "array_start"sv, "array_end"sv, "key"sv, "value"sv, "element"sv,
};
static_assert(stream_event_str_v.size() == std::size_t(StreamEvent::COUNT_));

enum class CompositeType : std::int8_t { Object, Array };

/// \brief Role of the next value, derived from the composite stack and the preceding separator.
enum class Slot : std::int8_t { Root, Key, Value, Element };
} // namespace

auto to_string_view(StreamEvent const event) -> std::string_view {
	if (int(event) < 0 || event >= StreamEvent::COUNT_) { return {}; }
	return stream_event_str_v.at(std::size_t(event));
}

struct JsonStreamer::Impl {
	explicit Impl(JsonStreamer& self, StreamOptions const& options) : self(self), options(options) {
		lexer.add_catch_all_listener([this](detail::LexEvent const event, detail::Literal const& literal) { on_lex_event(event, literal); });
	}

	void on_lex_event(detail::LexEvent const event, detail::Literal const& literal) {
		switch (event) {
		case detail::LexEvent::ObjectStart: open(CompositeType::Object); break;
		case detail::LexEvent::ArrayStart: open(CompositeType::Array); break;
		case detail::LexEvent::ObjectEnd: close_composite(CompositeType::Object); break;
		case detail::LexEvent::ArrayEnd: close_composite(CompositeType::Array); break;
		case detail::LexEvent::Literal: on_literal(literal); break;
		// one DocStart / DocEnd pair per streamer, however many documents the lexer sees
		case detail::LexEvent::DocStart:
		case detail::LexEvent::DocEnd:
		case detail::LexEvent::COUNT_: break;
		}
	}

	void open(CompositeType const type) {
		auto const is_object = type == CompositeType::Object;
		auto const token = is_object ? "{"sv : "["sv;
		if (next_slot(token) == Slot::Key) { throw make_error(Error::Type::MissingKey, token); }
		if (options.max_depth && stack.size() >= *options.max_depth) {
			auto error = make_error(Error::Type::DepthExceeded, token);
			error.limit = *options.max_depth;
			error.actual = stack.size() + 1;
			throw error;
		}
		stack.push_back(type);
		if (is_object) { pending_value = false; }
		self.fire(is_object ? StreamEvent::ObjectStart : StreamEvent::ArrayStart, detail::null_json_v);
	}

	void close_composite(CompositeType const type) {
		auto const is_object = type == CompositeType::Object;
		auto const token = is_object ? "}"sv : "]"sv;
		if (stack.empty() || stack.back() != type) { throw make_error(Error::Type::MismatchedBracket, token); }
		if (is_object && pending_value) { throw make_error(Error::Type::MissingColon, token); }
		stack.pop_back();
		pending_value = false;
		self.fire(is_object ? StreamEvent::ObjectEnd : StreamEvent::ArrayEnd, detail::null_json_v);
	}

	void on_literal(detail::Literal const& literal) {
		if (literal.type == detail::LiteralType::String) { check_string_size(literal.text); }
		switch (next_slot(literal.text)) {
		case Slot::Key:
			if (literal.type != detail::LiteralType::String) { throw make_error(Error::Type::MissingKey, literal.text); }
			pending_value = true;
			self.fire(StreamEvent::Key, literal.value);
			break;
		case Slot::Value:
			pending_value = false;
			self.fire(StreamEvent::Value, literal.value);
			break;
		case Slot::Element: self.fire(StreamEvent::Element, literal.value); break;
		case Slot::Root: throw make_error(Error::Type::UnexpectedToken, literal.text);
		}
	}

	[[nodiscard]] auto next_slot(std::string_view const token) const -> Slot {
		if (stack.empty()) { return Slot::Root; }
		auto const separator = lexer.get_separator();
		if (stack.back() == CompositeType::Array) {
			if (separator == ':') { throw make_error(Error::Type::UnexpectedToken, ":"); }
			return Slot::Element;
		}
		if (pending_value) {
			if (separator != ':') { throw make_error(Error::Type::MissingColon, token); }
			return Slot::Value;
		}
		if (separator == ':') { throw make_error(Error::Type::UnexpectedToken, ":"); }
		return Slot::Key;
	}

	void check_string_size(std::string_view const text) const {
		if (!options.max_string_size) { return; }
		auto const length = detail::utf8_length(text);
		if (length <= *options.max_string_size) { return; }
		auto error = make_error(Error::Type::StringSizeExceeded, {});
		error.limit = *options.max_string_size;
		error.actual = length;
		throw error;
	}

	[[nodiscard]] auto make_error(Error::Type const type, std::string_view const token) const -> Error {
		return Error{.type = type, .token = std::string{token}, .src_loc = lexer.get_src_loc()};
	}

	auto fail(Error error) -> Result {
		detail::log_error(error);
		return std::unexpected(std::move(error));
	}

	JsonStreamer& self;
	StreamOptions options;
	detail::Lexer lexer{};
	detail::Tape tape{};
	std::vector<CompositeType> stack{};
	std::optional<Error> fault{};
	bool pending_value{};
	bool started{};
	bool closed{};
};

JsonStreamer::JsonStreamer(StreamOptions const& options) : m_impl(std::make_unique<Impl>(*this, options)) {}

JsonStreamer::~JsonStreamer() { close(); }

auto JsonStreamer::consume(std::string_view const data) -> Result {
	auto& impl = *m_impl;
	if (impl.closed) { return impl.fail(Error{.type = Error::Type::StreamClosed, .src_loc = impl.lexer.get_src_loc()}); }
	if (impl.fault) { return std::unexpected(*impl.fault); }

	try {
		if (!impl.started) {
			impl.started = true;
			fire(StreamEvent::DocStart, detail::null_json_v);
		}

		impl.tape.write(data);
		auto const slice_size = std::max(impl.options.buffer_size, std::size_t{1});
		while (!impl.tape.is_empty()) {
			auto const result = impl.lexer.consume(impl.tape.read(slice_size));
			if (!result) {
				impl.fault = result.error();
				impl.tape.release();
				return impl.fail(result.error());
			}
		}
	} catch (...) {
		// a listener threw mid slice: poison the instance and propagate
		impl.fault = Error{.type = Error::Type::Unknown, .src_loc = impl.lexer.get_src_loc()};
		impl.tape.release();
		throw;
	}
	return {};
}

void JsonStreamer::close() {
	auto& impl = *m_impl;
	if (impl.closed) { return; }
	impl.closed = true;
	impl.lexer.close();
	impl.tape.release();
	impl.stack = {};
	fire(StreamEvent::DocEnd, detail::null_json_v);
}

auto JsonStreamer::is_closed() const -> bool { return m_impl->closed; }

auto JsonStreamer::get_options() const -> StreamOptions const& { return m_impl->options; }

auto JsonStreamer::get_depth() const -> std::size_t { return m_impl->stack.size(); }
} // namespace sj

// object streamer

namespace sj {
namespace {
using namespace std::string_view_literals;

constexpr auto object_event_str_v = std::array{
	"object_stream_start"sv, "object_stream_end"sv, "array_stream_start"sv, "array_stream_end"sv, "pair"sv, "element"sv,
};
static_assert(object_event_str_v.size() == std::size_t(ObjectEvent::COUNT_));
} // namespace

auto to_string_view(ObjectEvent const event) -> std::string_view {
	if (int(event) < 0 || event >= ObjectEvent::COUNT_) { return {}; }
	return object_event_str_v.at(std::size_t(event));
}

ObjectStreamer::ObjectStreamer(StreamOptions const& options) : m_streamer(options) {
	m_streamer.add_catch_all_listener([this](StreamEvent const event, Json const& payload) { on_event(event, payload); });
}

ObjectStreamer::~ObjectStreamer() { close(); }

auto ObjectStreamer::consume(std::string_view const data) -> Result { return m_streamer.consume(data); }

void ObjectStreamer::close() {
	m_streamer.close();
	reset();
}

void ObjectStreamer::on_event(StreamEvent const event, Json const& payload) {
	switch (event) {
	case StreamEvent::DocStart: reset(); break;
	case StreamEvent::ObjectStart: open(JsonType::Object); break;
	case StreamEvent::ArrayStart: open(JsonType::Array); break;
	case StreamEvent::ObjectEnd: close_container(JsonType::Object); break;
	case StreamEvent::ArrayEnd: close_container(JsonType::Array); break;
	case StreamEvent::Key: m_keys.emplace_back(payload.as_string_view()); break;
	case StreamEvent::Value: on_value(payload); break;
	case StreamEvent::Element: on_element(payload); break;
	case StreamEvent::DocEnd:
	case StreamEvent::COUNT_: break;
	}
}

void ObjectStreamer::reset() {
	m_root.reset();
	m_containers.clear();
	m_keys.clear();
}

void ObjectStreamer::open(JsonType const type) {
	auto const is_object = type == JsonType::Object;
	if (!m_root) {
		m_root = type;
		fire(is_object ? ObjectEvent::ObjectStreamStart : ObjectEvent::ArrayStreamStart, {}, detail::null_json_v);
		return;
	}
	m_containers.push_back(is_object ? Json::empty_object() : Json::empty_array());
}

void ObjectStreamer::close_container(JsonType const type) {
	if (m_containers.empty()) {
		// root closed: a following document opens a new stream
		m_root.reset();
		fire(type == JsonType::Object ? ObjectEvent::ObjectStreamEnd : ObjectEvent::ArrayStreamEnd, {}, detail::null_json_v);
		return;
	}
	auto finished = std::move(m_containers.back());
	m_containers.pop_back();
	attach(std::move(finished));
}

void ObjectStreamer::on_value(Json const& value) {
	auto key = pop_key();
	if (m_containers.empty()) {
		fire(ObjectEvent::Pair, key, value);
		return;
	}
	m_containers.back().insert_or_assign(std::move(key), value);
}

void ObjectStreamer::on_element(Json const& value) {
	if (m_containers.empty()) {
		fire(ObjectEvent::Element, {}, value);
		return;
	}
	m_containers.back().push_back(value);
}

void ObjectStreamer::attach(Json value) {
	if (m_containers.empty()) {
		if (m_keys.empty()) {
			fire(ObjectEvent::Element, {}, value);
		} else {
			auto const key = pop_key();
			fire(ObjectEvent::Pair, key, value);
		}
		return;
	}
	auto& parent = m_containers.back();
	if (parent.is_array() || m_keys.empty()) {
		parent.push_back(std::move(value));
		return;
	}
	parent.insert_or_assign(pop_key(), std::move(value));
}

auto ObjectStreamer::pop_key() -> std::string {
	if (m_keys.empty()) { return {}; }
	auto ret = std::move(m_keys.back());
	m_keys.pop_back();
	return ret;
}
} // namespace sj

// json

namespace sj {
namespace {
template <typename T>
[[nodiscard]] constexpr auto number_as(detail::literal::Number const& in) {
	auto const visitor = [](auto const n) { return static_cast<T>(n); };
	return std::visit(visitor, in.payload);
}

struct NumberEqual {
	template <typename A, typename B>
	constexpr auto operator()(A const a, B const b) const -> bool {
		if constexpr (std::integral<A> && std::integral<B>) {
			return std::cmp_equal(a, b);
		} else {
			return static_cast<double>(a) == static_cast<double>(b);
		}
	}
};

auto const empty_object_v = detail::Object{};
} // namespace

void Json::Deleter::operator()(detail::Value* ptr) const noexcept { std::default_delete<detail::Value>{}(ptr); }

Json::Json(Json const& other) {
	// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
	if (other.m_value) { m_value.reset(new detail::Value{*other.m_value}); }
}

auto Json::operator=(Json const& other) -> Json& {
	if (&other != this) {
		if (!other.m_value) {
			m_value.reset();
		} else {
			ensure_impl();
			*m_value = *other.m_value;
		}
	}
	return *this;
}

auto Json::empty_array() -> Json const& {
	static auto const ret = [] {
		auto json = Json{};
		json.set_array();
		return json;
	}();
	return ret;
}

auto Json::empty_object() -> Json const& {
	static auto const ret = [] {
		auto json = Json{};
		json.set_object();
		return json;
	}();
	return ret;
}

auto Json::get_type() const -> Type {
	if (m_value) { return Type(m_value->payload.index() + 1); }
	return Type::Null;
}

auto Json::is_integer() const -> bool { return is_number() && std::get<detail::literal::Number>(m_value->payload).is_integer(); }

auto Json::as_bool(bool const fallback) const -> bool {
	if (!is_boolean()) { return fallback; }
	return std::get<detail::literal::Bool>(m_value->payload).value;
}

auto Json::as_double(double const fallback) const -> double {
	if (!is_number()) { return fallback; }
	return number_as<double>(std::get<detail::literal::Number>(m_value->payload));
}

auto Json::as_u64(std::uint64_t const fallback) const -> std::uint64_t {
	if (!is_number()) { return fallback; }
	return number_as<std::uint64_t>(std::get<detail::literal::Number>(m_value->payload));
}

auto Json::as_i64(std::int64_t const fallback) const -> std::int64_t {
	if (!is_number()) { return fallback; }
	return number_as<std::int64_t>(std::get<detail::literal::Number>(m_value->payload));
}

auto Json::as_string_view(std::string_view const fallback) const -> std::string_view {
	if (!is_string()) { return fallback; }
	return std::get<detail::literal::String>(m_value->payload).text;
}

auto Json::as_array() const -> std::span<Json const> {
	if (!is_array()) { return {}; }
	return std::get<detail::Array>(m_value->payload).members;
}

auto Json::as_object() const -> StringTable<Json> const& {
	if (!is_object()) { return empty_object_v.members; }
	return std::get<detail::Object>(m_value->payload).members;
}

void Json::set_null() { m_value.reset(); }

void Json::set_boolean(bool const value) {
	ensure_impl();
	m_value->payload = detail::literal::Bool{.value = value};
}

void Json::set_string(std::string_view const value) {
	ensure_impl();
	m_value->payload = detail::literal::String{.text = std::string{value}};
}

void Json::set_number(std::int64_t const value) {
	ensure_impl();
	m_value->payload = detail::literal::Number{.payload = value};
}

void Json::set_number(std::uint64_t const value) {
	ensure_impl();
	m_value->payload = detail::literal::Number{.payload = value};
}

void Json::set_number(double const value) {
	ensure_impl();
	m_value->payload = detail::literal::Number{.payload = value};
}

void Json::set_array() {
	ensure_impl();
	m_value->morph<detail::Array>().members.clear();
}

void Json::set_object() {
	ensure_impl();
	m_value->morph<detail::Object>().members.clear();
}

auto Json::push_back(Json value) -> Json& {
	ensure_impl();
	return m_value->morph<detail::Array>().members.emplace_back(std::move(value));
}

auto Json::insert_or_assign(std::string key, Json value) -> Json& {
	ensure_impl();
	auto& table = m_value->morph<detail::Object>().members;
	auto const [it, _] = table.insert_or_assign(std::move(key), std::move(value));
	return it->second;
}

auto Json::operator[](std::string_view const key) const -> Json const& {
	if (!is_object()) { return detail::null_json_v; }
	auto const& object = std::get<detail::Object>(m_value->payload);
	auto const it = object.members.find(key);
	if (it == object.members.end()) { return detail::null_json_v; }
	return it->second;
}

auto Json::operator[](std::size_t const index) const -> Json const& {
	if (!is_array()) { return detail::null_json_v; }
	auto const& array = std::get<detail::Array>(m_value->payload);
	if (index >= array.members.size()) { return detail::null_json_v; }
	return array.members.at(index);
}

auto operator==(Json const& a, Json const& b) -> bool {
	if (a.get_type() != b.get_type()) { return false; }
	switch (a.get_type()) {
	case JsonType::Null: return true;
	case JsonType::Boolean: return a.as_bool() == b.as_bool();
	case JsonType::Number: {
		auto const& lhs = std::get<detail::literal::Number>(a.m_value->payload);
		auto const& rhs = std::get<detail::literal::Number>(b.m_value->payload);
		return std::visit(NumberEqual{}, lhs.payload, rhs.payload);
	}
	case JsonType::String: return a.as_string_view() == b.as_string_view();
	case JsonType::Array: return std::ranges::equal(a.as_array(), b.as_array());
	case JsonType::Object: return a.as_object() == b.as_object();
	case JsonType::COUNT_: break;
	}
	return false;
}

void Json::ensure_impl() {
	if (m_value) { return; }
	// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
	m_value.reset(new detail::Value);
}
} // namespace sj
