/// @file logging.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace shapediff_cpp {

/// Name under which the library logs.
inline constexpr std::string_view logger_name = "shapediff";

/// The library logger.
///
/// Returns the logger registered with spdlog under logger_name. If the
/// application has not registered one, a stderr logger at level warn is
/// created and registered on first use. To see compilation details:
/// @code
/// shapediff_cpp::logger()->set_level(spdlog::level::debug);
/// @endcode
auto logger() -> std::shared_ptr<spdlog::logger>;

}  // namespace shapediff_cpp
