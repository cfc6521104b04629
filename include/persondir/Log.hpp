/**
 * @file Log.hpp
 * @brief Library logger
 *
 * All persondir components log through one spdlog logger named
 * "persondir", writing to stderr. Default level is info.
 */

#ifndef PERSONDIR_LOG_HPP
#define PERSONDIR_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace persondir {

/**
 * @brief Get the library logger, creating it on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Change the library log level
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace persondir

#endif // PERSONDIR_LOG_HPP
