/**
 * @file utils.hpp
 * @brief Path helpers shared by the command-line front end
 *
 * Key utilities:
 * - cleanPath: Lexical path cleanup without touching the filesystem
 * - formatRootLabel: Label printed above the tree
 *
 * @see cleanPath()
 * @see formatRootLabel()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>

/**
 * @brief Lexically cleans a path
 *
 * Removes "." components, resolves ".." against preceding components and
 * drops trailing separators. The filesystem is not consulted.
 *
 * Example outputs:
 * - cleanPath("") → "."
 * - cleanPath("./src/") → "src"
 * - cleanPath("a/b/../c") → "a/c"
 * - cleanPath("/") → "/"
 */
inline std::string cleanPath(const std::string &input) {
  if (input.empty())
    return ".";

  std::string cleaned = std::filesystem::path(input).lexically_normal().string();
  while (cleaned.size() > 1 && cleaned.back() == '/')
    cleaned.pop_back();

  return cleaned.empty() ? "." : cleaned;
}

/**
 * @brief Formats the label printed for the root of the tree
 *
 * Rules:
 * - An input that cleans to "." is shown as "."
 * - An input already ending in '/' is shown as typed
 * - Anything else is shown cleaned, with a trailing '/'
 *
 * Example outputs:
 * - formatRootLabel("") → "."
 * - formatRootLabel("./") → "."
 * - formatRootLabel("src/") → "src/"
 * - formatRootLabel("./src") → "src/"
 */
inline std::string formatRootLabel(const std::string &input) {
  const std::string cleaned = cleanPath(input);
  if (cleaned == ".")
    return cleaned;

  if (!input.empty() && input.back() == '/')
    return input;

  return cleaned + "/";
}

#endif // UTILS_HPP
