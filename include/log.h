/// @file log.h
/// @brief Namespaced loggers for the blank-line engine
///
/// Each component logs through its own named spdlog logger
/// ("BlankLineManager", "IndentationRules", "WordmlReader", ...). All of
/// them share one stderr sink so that stdout stays reserved for the
/// serialized document.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_LOG_H
#define BLANKLINE_CPP_LOG_H

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace blankline_cpp {

/// @brief Get (or create) the logger for a component namespace
///
/// New loggers pick up the level last passed to setLogLevel(), which is
/// `warn` until changed.
std::shared_ptr<spdlog::logger> logger(std::string const& name);

/// @brief Set the level of every existing and future component logger
void setLogLevel(spdlog::level::level_enum level);

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_LOG_H
