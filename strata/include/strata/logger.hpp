#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace strata::logger {

// Set library default logger.
// The library itself never creates sinks, the host application owns them.
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

}  // namespace strata::logger

#endif  // LOGGER_HPP
