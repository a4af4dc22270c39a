#pragma once
#include <cstdint>

namespace sj {
/// \brief Source location within the stream consumed so far.
/// Lines and columns are 1-based; a zero line means "no location".
struct SrcLoc {
	std::uint64_t line{};
	std::uint64_t column{};

	auto operator==(SrcLoc const&) const -> bool = default;
};
} // namespace sj
