#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace fsprov::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

}  // namespace fsprov::logger

#endif  // LOGGER_HPP
