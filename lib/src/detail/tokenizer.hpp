#pragma once
#include <detail/token.hpp>
#include <concepts>

namespace sj::detail {
/// \brief Stateless character classifier.
class Tokenizer {
  public:
	[[nodiscard]] static constexpr auto classify(char const c) -> Token {
		switch (c) {
		case '{': return Token{.type = TokenType::LBrace, .ch = c};
		case '}': return Token{.type = TokenType::RBrace, .ch = c};
		case '[': return Token{.type = TokenType::LSquare, .ch = c};
		case ']': return Token{.type = TokenType::RSquare, .ch = c};
		case ',': return Token{.type = TokenType::Comma, .ch = c};
		case ':': return Token{.type = TokenType::Colon, .ch = c};
		case '"': return Token{.type = TokenType::DQuote, .ch = c};
		case ' ':
		case '\t':
		case '\r': return Token{.type = TokenType::Whitespace, .ch = c};
		case '\n': return Token{.type = TokenType::Newline, .ch = c};
		case '\\': return Token{.type = TokenType::Backslash, .ch = c};
		default: return Token{.type = TokenType::Char, .ch = c};
		}
	}

	/// \brief Invoke on_token once per character of chunk, in order.
	template <std::invocable<Token> F>
	static constexpr void consume(std::string_view const chunk, F&& on_token) {
		for (char const c : chunk) { on_token(classify(c)); }
	}
};
} // namespace sj::detail
