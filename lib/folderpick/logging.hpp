/**
 * @file logging.hpp
 * @brief spdlog setup for the folder picker
 *
 * stdout is reserved for the selected path, so no logger ever writes there.
 */

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

class PickerConfig;

/** @brief Name of the default logger */
inline constexpr const char *LOGGER_NAME = "folderpick";

/**
 * @brief Installs a stderr logger at warn level
 *
 * Used for startup problems (bad config, unusable start path) before the
 * terminal UI takes over the screen.
 */
void initConsoleLogging();

/**
 * @brief Switches logging to its while-the-UI-runs setup
 *
 * With a log file configured, the default logger appends to it at the
 * configured level. Otherwise logging is turned off so the fullscreen UI is
 * never overwritten.
 *
 * @param config Loaded configuration
 * @return false if the log file could not be opened (logging is off then)
 */
bool configureLogging(const PickerConfig &config);

#endif // LOGGING_HPP
