/**
 * @file pathutils.hpp
 * @brief Path helpers shared by the browser core and the terminal frontend
 *
 * All functions work on absolute, lexically normalized path strings without
 * a trailing separator (except for "/" itself). The home directory is passed
 * in explicitly so callers and tests control it.
 */

#ifndef PATHUTILS_HPP
#define PATHUTILS_HPP

#include <optional>
#include <string>

/**
 * @brief Resolves the current user's home directory
 *
 * Uses $HOME first and falls back to the passwd database.
 *
 * @return The home directory, or std::nullopt if neither source yields one
 */
std::optional<std::string> homeDirectory();

/**
 * @brief Expands a leading "~" or "~/" using the given home directory
 *
 * "~user" forms are not expanded. Without a home directory the path is
 * returned unchanged.
 *
 * @param path Path as typed by the user
 * @param home Resolved home directory, if any
 * @return The expanded path
 */
std::string expandHome(const std::string &path,
                       const std::optional<std::string> &home);

/**
 * @brief Shortens a path for display by replacing the home prefix with "~"
 *
 * Only whole components are replaced: with home "/home/u", "/home/u/src"
 * becomes "~/src" but "/home/u2" is left alone.
 */
std::string displayPath(const std::string &path,
                        const std::optional<std::string> &home);

/**
 * @brief Turns the optional start argument into an absolute directory path
 *
 * Empty input means the current working directory ("/" if that cannot be
 * read). The result is absolute, normalized and has no trailing separator.
 */
std::string resolveStartPath(const std::string &arg,
                             const std::optional<std::string> &home);

/** @brief Normalizes an absolute path and strips a trailing separator */
std::string normalizePath(const std::string &path);

/** @brief Last path component; "/" for the filesystem root */
std::string baseName(const std::string &path);

/** @brief Parent directory; "/" is its own parent */
std::string parentPath(const std::string &path);

/** @brief Appends one component to a directory path */
std::string joinPath(const std::string &dir, const std::string &name);

#endif // PATHUTILS_HPP
