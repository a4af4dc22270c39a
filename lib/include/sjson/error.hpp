#pragma once
#include <sjson/src_loc.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace sj {
/// \brief Various kinds of stream errors.
/// Grammar faults carry the offending token and the name of the lexer state that rejected it.
/// Limit errors carry the configured limit and the value that violated it.
struct Error {
	enum class Type : std::int8_t {
		Unknown,
		UnexpectedToken,
		InvalidLiteral,
		InvalidNumber,
		MissingKey,
		MissingColon,
		MismatchedBracket,
		DepthExceeded,
		StringSizeExceeded,
		StreamClosed,
		COUNT_,
	};

	Type type{Type::Unknown};
	std::string token{};
	std::string_view state{};
	std::uint64_t limit{};
	std::uint64_t actual{};
	SrcLoc src_loc{};
};

/// \brief Result of feeding a chunk to a streamer.
using Result = std::expected<void, Error>;

/// \brief Obtain stringified Error Type.
auto to_string_view(Error::Type type) -> std::string_view;

/// \brief Obtain print-friendly error string.
auto to_string(Error const& error) -> std::string;

/// \brief Check if error is a configured policy limit (as opposed to malformed input).
[[nodiscard]] constexpr auto is_limit_error(Error const& error) -> bool {
	return error.type == Error::Type::DepthExceeded || error.type == Error::Type::StringSizeExceeded;
}

/// \brief Error log callback.
using ErrorLogger = void (*)(Error const&);

/// \brief Default logger: writes "[sjson] Error: ..." to stderr.
void log_to_stderr(Error const& error);

/// \brief Replace the process-wide error logger. Pass nullptr to silence.
void set_error_logger(ErrorLogger logger);
} // namespace sj
