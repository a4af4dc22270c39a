#pragma once
#include <sjson/json.hpp>
#include <sjson/string_table.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sj::detail {
namespace literal {
struct Bool {
	bool value{};
};

/// \brief Integer source text is stored as int64 (uint64 if out of its range), anything else as double.
struct Number {
	using Payload = std::variant<std::int64_t, std::uint64_t, double>;

	[[nodiscard]] auto is_integer() const -> bool { return !std::holds_alternative<double>(payload); }

	Payload payload{};
};

/// \brief Verbatim text between the quotes, escape sequences included.
struct String {
	std::string text{};
};
} // namespace literal

struct Array {
	std::vector<sj::Json> members{};
};

struct Object {
	StringTable<sj::Json> members{};
};

struct Value {
	using Payload = std::variant<literal::Bool, literal::Number, literal::String, Array, Object>;

	template <typename T>
	auto morph() -> T& {
		auto* ret = std::get_if<T>(&payload);
		if (!ret) { ret = &payload.emplace<T>(); }
		return *ret;
	}

	Payload payload{};
};

/// \brief Payload of structural events and fallback of failed lookups.
inline auto const null_json_v = sj::Json{};
} // namespace sj::detail
