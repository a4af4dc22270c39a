#pragma once
#include <sjson/error.hpp>

namespace sj::detail {
/// \brief Report error through the installed error logger (if any).
void log_error(Error const& error);
} // namespace sj::detail
