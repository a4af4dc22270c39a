#pragma once
#include <detail/token.hpp>
#include <array>
#include <initializer_list>

namespace sj::detail {
enum class LexerState : std::int8_t {
	New,
	DocStart,
	DocEnd,
	ObjectStart,
	ObjectEnd,
	ArrayStart,
	ArrayEnd,
	StringStart,
	StringEnd,
	StringEscaping,
	Literal,
	More,
	COUNT_,
};

inline constexpr auto lexer_state_str_v = std::array{
	"new"sv,
	"doc_start"sv,
	"doc_end"sv,
	"object_start"sv,
	"object_end"sv,
	"array_start"sv,
	"array_end"sv,
	"string_start"sv,
	"string_end"sv,
	"string_escaping"sv,
	"literal"sv,
	"more"sv,
};
static_assert(lexer_state_str_v.size() == std::size_t(LexerState::COUNT_));

[[nodiscard]] constexpr auto to_string_view(LexerState const state) -> std::string_view { return lexer_state_str_v.at(std::size_t(state)); }

/// \brief Outcome of a signal in a state.
enum class Action : std::int8_t { Fault, Ignore, Loop, Transit };

struct Transition {
	Action action{Action::Fault};
	LexerState target{LexerState::New};
};

/// \brief Total (state x signal) transition table. Cells not declared otherwise fault.
class TransitionTable {
  public:
	static constexpr auto state_count_v = std::size_t(LexerState::COUNT_);
	static constexpr auto signal_count_v = std::size_t(TokenType::COUNT_);

	[[nodiscard]] constexpr auto at(LexerState const state, TokenType const signal) const -> Transition {
		return m_cells.at(std::size_t(state)).at(std::size_t(signal));
	}

	constexpr void on(LexerState const from, TokenType const signal, LexerState const to) {
		cell(from, signal) = Transition{.action = Action::Transit, .target = to};
	}

	constexpr void on(LexerState const from, std::initializer_list<TokenType> const signals, LexerState const to) {
		for (auto const signal : signals) { on(from, signal, to); }
	}

	constexpr void loops(LexerState const state, std::initializer_list<TokenType> const signals) {
		for (auto const signal : signals) { cell(state, signal) = Transition{.action = Action::Loop, .target = state}; }
	}

	constexpr void ignores(LexerState const state, std::initializer_list<TokenType> const signals) {
		for (auto const signal : signals) { cell(state, signal) = Transition{.action = Action::Ignore, .target = state}; }
	}

  private:
	constexpr auto cell(LexerState const state, TokenType const signal) -> Transition& {
		return m_cells.at(std::size_t(state)).at(std::size_t(signal));
	}

	std::array<std::array<Transition, signal_count_v>, state_count_v> m_cells{};
};

[[nodiscard]] constexpr auto make_transition_table() -> TransitionTable {
	using S = LexerState;
	using T = TokenType;
	auto ret = TransitionTable{};

	ret.on(S::New, T::Start, S::DocStart);
	ret.ignores(S::New, {T::Whitespace, T::Newline});

	ret.on(S::DocStart, T::LBrace, S::ObjectStart);
	ret.on(S::DocStart, T::LSquare, S::ArrayStart);
	ret.ignores(S::DocStart, {T::Whitespace, T::Newline});

	ret.on(S::DocEnd, T::Reset, S::New);

	ret.on(S::ObjectStart, T::DQuote, S::StringStart);
	ret.on(S::ObjectStart, T::RBrace, S::ObjectEnd);
	ret.loops(S::ObjectStart, {T::LBrace});
	ret.ignores(S::ObjectStart, {T::Whitespace, T::Newline});

	ret.loops(S::ObjectEnd, {T::RBrace});
	ret.on(S::ObjectEnd, T::RSquare, S::ArrayEnd);
	ret.on(S::ObjectEnd, T::Comma, S::More);
	ret.ignores(S::ObjectEnd, {T::Whitespace, T::Newline});

	ret.on(S::ArrayStart, T::LBrace, S::ObjectStart);
	ret.loops(S::ArrayStart, {T::LSquare});
	ret.on(S::ArrayStart, T::RSquare, S::ArrayEnd);
	ret.on(S::ArrayStart, T::DQuote, S::StringStart);
	ret.on(S::ArrayStart, T::Char, S::Literal);
	ret.ignores(S::ArrayStart, {T::Whitespace, T::Newline});

	ret.loops(S::ArrayEnd, {T::RSquare});
	ret.on(S::ArrayEnd, T::RBrace, S::ObjectEnd);
	ret.on(S::ArrayEnd, T::Comma, S::More);
	ret.ignores(S::ArrayEnd, {T::Whitespace, T::Newline});

	ret.loops(S::StringStart, {T::Char, T::Comma, T::Colon, T::Whitespace, T::Newline, T::LBrace, T::RBrace, T::LSquare, T::RSquare});
	ret.on(S::StringStart, T::Backslash, S::StringEscaping);
	ret.on(S::StringStart, T::DQuote, S::StringEnd);

	// the token following a backslash is always part of the string
	for (auto signal = T::LBrace; is_input(signal); signal = T(int(signal) + 1)) { ret.on(S::StringEscaping, signal, S::StringStart); }

	ret.on(S::StringEnd, T::RBrace, S::ObjectEnd);
	ret.on(S::StringEnd, T::RSquare, S::ArrayEnd);
	ret.on(S::StringEnd, {T::Comma, T::Colon}, S::More);
	ret.ignores(S::StringEnd, {T::Whitespace, T::Newline});

	ret.loops(S::Literal, {T::Char});
	ret.on(S::Literal, T::RBrace, S::ObjectEnd);
	ret.on(S::Literal, T::RSquare, S::ArrayEnd);
	ret.on(S::Literal, T::Comma, S::More);
	ret.ignores(S::Literal, {T::Whitespace, T::Newline});

	ret.on(S::More, T::LBrace, S::ObjectStart);
	ret.on(S::More, T::LSquare, S::ArrayStart);
	ret.on(S::More, T::DQuote, S::StringStart);
	ret.on(S::More, T::Char, S::Literal);
	ret.ignores(S::More, {T::Whitespace, T::Newline});

	// end of document: reached on closing the root container, or forced by close()
	for (auto state = S::DocStart; state != S::COUNT_; state = S(int(state) + 1)) {
		if (state != S::DocEnd) { ret.on(state, T::End, S::DocEnd); }
	}

	return ret;
}

inline constexpr auto transition_table_v = make_transition_table();

namespace table_check {
/// \brief Transit never targets its own state, Loop and Ignore always do.
[[nodiscard]] constexpr auto is_consistent(TransitionTable const& table) -> bool {
	for (std::size_t s = 0; s < TransitionTable::state_count_v; ++s) {
		for (std::size_t t = 0; t < TransitionTable::signal_count_v; ++t) {
			auto const transition = table.at(LexerState(s), TokenType(t));
			switch (transition.action) {
			case Action::Transit:
				if (transition.target == LexerState(s)) { return false; }
				break;
			case Action::Loop:
			case Action::Ignore:
				if (transition.target != LexerState(s)) { return false; }
				break;
			case Action::Fault: break;
			}
		}
	}
	return true;
}

/// \brief Only the control signals move the lexer out of new and doc_end.
[[nodiscard]] constexpr auto has_gated_document_boundaries(TransitionTable const& table) -> bool {
	for (std::size_t t = 0; t < TransitionTable::signal_count_v; ++t) {
		auto const signal = TokenType(t);
		auto const in_new = table.at(LexerState::New, signal).action;
		if (signal != TokenType::Start && in_new != Action::Fault && in_new != Action::Ignore) { return false; }
		if (signal != TokenType::Reset && table.at(LexerState::DocEnd, signal).action != Action::Fault) { return false; }
	}
	return true;
}

/// \brief Every state inside a document can be forced to doc_end.
[[nodiscard]] constexpr auto can_always_end(TransitionTable const& table) -> bool {
	for (std::size_t s = 0; s < TransitionTable::state_count_v; ++s) {
		auto const state = LexerState(s);
		if (state == LexerState::New || state == LexerState::DocEnd) { continue; }
		auto const transition = table.at(state, TokenType::End);
		if (transition.action != Action::Transit || transition.target != LexerState::DocEnd) { return false; }
	}
	return true;
}
} // namespace table_check

static_assert(table_check::is_consistent(transition_table_v));
static_assert(table_check::has_gated_document_boundaries(transition_table_v));
static_assert(table_check::can_always_end(transition_table_v));
} // namespace sj::detail
