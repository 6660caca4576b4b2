/**
 * @file pathutils.cpp
 * @brief Implementation of home expansion and path normalization helpers
 */

#include "pathutils.hpp"

#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <system_error>
#include <unistd.h>

std::optional<std::string> homeDirectory() {
  const char *home = std::getenv("HOME");
  if (home && *home) {
    return normalizePath(home);
  }

  // No $HOME (e.g. started from a service); ask the passwd database
  if (const passwd *pw = getpwuid(getuid())) {
    if (pw->pw_dir && *pw->pw_dir) {
      return normalizePath(pw->pw_dir);
    }
  }
  return std::nullopt;
}

std::string expandHome(const std::string &path,
                       const std::optional<std::string> &home) {
  if (!home) {
    return path;
  }
  if (path == "~") {
    return *home;
  }
  if (path.compare(0, 2, "~/") == 0) {
    return *home + path.substr(1);
  }
  return path;
}

std::string displayPath(const std::string &path,
                        const std::optional<std::string> &home) {
  if (!home || home->empty() || *home == "/") {
    return path;
  }
  if (path == *home) {
    return "~";
  }
  if (path.compare(0, home->size(), *home) == 0 &&
      path.size() > home->size() && path[home->size()] == '/') {
    return "~" + path.substr(home->size());
  }
  return path;
}

std::string normalizePath(const std::string &path) {
  std::string normal = std::filesystem::path(path).lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal.empty() ? std::string("/") : normal;
}

std::string resolveStartPath(const std::string &arg,
                             const std::optional<std::string> &home) {
  std::error_code ec;
  std::string start = arg;

  if (start.empty()) {
    auto cwd = std::filesystem::current_path(ec);
    start = ec ? std::string("/") : cwd.string();
  }

  start = expandHome(start, home);

  auto absolute = std::filesystem::absolute(start, ec);
  if (!ec) {
    start = absolute.string();
  }

  return normalizePath(start);
}

std::string baseName(const std::string &path) {
  if (path == "/") {
    return "/";
  }
  std::string name = std::filesystem::path(path).filename().string();
  return name.empty() ? path : name;
}

std::string parentPath(const std::string &path) {
  if (path == "/") {
    return path;
  }
  std::string parent = std::filesystem::path(path).parent_path().string();
  return parent.empty() ? std::string("/") : parent;
}

std::string joinPath(const std::string &dir, const std::string &name) {
  return (std::filesystem::path(dir) / name).string();
}
