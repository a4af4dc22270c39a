#pragma once
#include <array>
#include <cstdint>
#include <string_view>

namespace sj::detail {
using namespace std::string_view_literals;

/// \brief Signal alphabet driving the lexer.
/// Every type before Start is produced by the tokenizer, one per input character.
/// Start, End and Reset are control signals issued by the lexer itself.
enum class TokenType : std::int8_t {
	LBrace,
	RBrace,
	LSquare,
	RSquare,
	Comma,
	Colon,
	DQuote,
	Whitespace,
	Newline,
	Backslash,
	Char,
	Start,
	End,
	Reset,
	COUNT_,
};

inline constexpr auto token_type_str_v = std::array{
	"lbrace"sv,
	"rbrace"sv,
	"lsquare"sv,
	"rsquare"sv,
	"comma"sv,
	"colon"sv,
	"dquote"sv,
	"whitespace"sv,
	"newline"sv,
	"backslash"sv,
	"char"sv,
	"start"sv,
	"end"sv,
	"reset"sv,
};
static_assert(token_type_str_v.size() == std::size_t(TokenType::COUNT_));

[[nodiscard]] constexpr auto to_string_view(TokenType const type) -> std::string_view { return token_type_str_v.at(std::size_t(type)); }

/// \brief Input tokens precede control signals.
[[nodiscard]] constexpr auto is_input(TokenType const type) -> bool { return type < TokenType::Start; }

[[nodiscard]] constexpr auto is_blank(TokenType const type) -> bool { return type == TokenType::Whitespace || type == TokenType::Newline; }

struct Token {
	TokenType type{TokenType::Char};
	char ch{};
};
} // namespace sj::detail
