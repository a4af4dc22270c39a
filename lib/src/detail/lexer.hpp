#pragma once
#include <detail/lexer_state.hpp>
#include <detail/literal.hpp>
#include <detail/text_accumulator.hpp>
#include <sjson/error.hpp>
#include <sjson/event_source.hpp>

namespace sj::detail {
enum class LexEvent : std::int8_t { DocStart, DocEnd, ObjectStart, ObjectEnd, ArrayStart, ArrayEnd, Literal, COUNT_ };

inline constexpr auto lex_event_str_v = std::array{
	"doc_start"sv, "doc_end"sv, "object_start"sv, "object_end"sv, "array_start"sv, "array_end"sv, "literal"sv,
};
static_assert(lex_event_str_v.size() == std::size_t(LexEvent::COUNT_));

/// \brief Token driven state machine.
/// Fires a structural event on entering (or looping on) a document or container state,
/// and a Literal event when a string or bare literal is complete.
/// Parses any number of whitespace separated documents: each root container close fires DocEnd,
/// and the next significant token starts a new document.
class Lexer : public EventSource<LexEvent, Literal const&> {
  public:
	/// \brief Feed a chunk, tokens may be split across chunks arbitrarily.
	/// Errors thrown by listeners are returned as well.
	[[nodiscard]] auto consume(std::string_view chunk) -> Result;

	/// \brief Force the end of an open document and release the text buffer.
	void close();

	[[nodiscard]] auto get_state() const -> LexerState { return m_state; }
	[[nodiscard]] auto get_src_loc() const -> SrcLoc { return m_src_loc; }
	[[nodiscard]] auto get_depth() const -> std::size_t { return m_depth; }
	[[nodiscard]] auto is_started() const -> bool { return m_started; }
	[[nodiscard]] auto is_closed() const -> bool { return m_closed; }

	/// \brief Separator (',' or ':') preceding the current value, or '\0' right after an opening bracket.
	[[nodiscard]] auto get_separator() const -> char { return m_separator; }

  private:
	void on_token(Token token);
	void drive(TokenType signal, Token token);
	void enter(LexerState from, LexerState to, char trigger);
	void emit_string();
	void emit_literal();
	void advance_src_loc(char c);

	[[nodiscard]] auto make_error(Error::Type type, std::string token) const -> Error;

	TextAccumulator m_text{};
	LexerState m_state{LexerState::New};
	SrcLoc m_src_loc{};
	SrcLoc m_next_loc{.line = 1, .column = 1};
	std::size_t m_depth{};
	char m_separator{};
	bool m_started{};
	bool m_literal_done{};
	bool m_closed{};
};
} // namespace sj::detail
