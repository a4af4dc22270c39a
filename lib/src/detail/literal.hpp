#pragma once
#include <sjson/json.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace sj::detail {
using namespace std::string_view_literals;

enum class LiteralType : std::int8_t { String, Number, Boolean, Null, COUNT_ };

inline constexpr auto literal_type_str_v = std::array{"string"sv, "number"sv, "boolean"sv, "null"sv};
static_assert(literal_type_str_v.size() == std::size_t(LiteralType::COUNT_));

/// \brief Typed scalar produced by the lexer.
/// text is the verbatim source (without quotes), valid for the duration of the event.
struct Literal {
	LiteralType type{LiteralType::Null};
	Json value{};
	std::string_view text{};
};

[[nodiscard]] constexpr auto is_digit(char const c) -> bool { return c >= '0' && c <= '9'; }

/// \brief Match text against [-+]?[0-9]*\.?[0-9]+([eE][-+]?[0-9]+)?
[[nodiscard]] constexpr auto is_number_literal(std::string_view text) -> bool {
	auto const skip_sign = [&text] {
		if (text.starts_with('-') || text.starts_with('+')) { text.remove_prefix(1); }
	};
	auto const skip_digits = [&text] {
		auto ret = std::size_t{};
		while (!text.empty() && is_digit(text.front())) {
			text.remove_prefix(1);
			++ret;
		}
		return ret;
	};

	skip_sign();
	auto const integral = skip_digits();
	if (text.starts_with('.')) {
		text.remove_prefix(1);
		if (skip_digits() == 0) { return false; }
	} else if (integral == 0) {
		return false;
	}

	if (text.starts_with('e') || text.starts_with('E')) {
		text.remove_prefix(1);
		skip_sign();
		if (skip_digits() == 0) { return false; }
	}
	return text.empty();
}

/// \brief Number text without fraction or exponent is stored as an integer.
[[nodiscard]] constexpr auto is_integer_literal(std::string_view const text) -> bool { return text.find_first_of(".eE") == std::string_view::npos; }

/// \brief Length of text in UTF-8 code points (continuation bytes are not counted).
[[nodiscard]] constexpr auto utf8_length(std::string_view const text) -> std::size_t {
	auto ret = std::size_t{};
	for (char const c : text) {
		if ((static_cast<unsigned char>(c) & 0xc0) != 0x80) { ++ret; }
	}
	return ret;
}

/// \brief Parse matched number text.
/// Integers are stored as int64, falling back to uint64 for positive values beyond its range.
/// \returns false if the value is not representable.
[[nodiscard]] auto to_number(std::string_view text, Json& out) -> bool;
} // namespace sj::detail
