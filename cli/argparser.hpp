#ifndef ARGPARSER_HPP
#define ARGPARSER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "walkoptions.hpp"

/**
 * @brief Invalid command line; the message is meant for the user
 */
class ArgParseError : public std::runtime_error {
public:
  explicit ArgParseError(const std::string &msg) : std::runtime_error(msg) {}
};

/**
 * @brief Settings collected from the command line
 *
 * Numeric limits use 0 for "unlimited", as typed by the user. The
 * conversion helpers turn that into the optional bounds used by the core.
 */
struct CliOptions {
  std::string path = ".";
  std::size_t maxFiles = 5;
  std::size_t maxDirs = 1;
  std::size_t maxLevel = 0;
  bool noColor = false;
  bool showHelp = false;

  WalkOptions toWalkOptions() const;
  LayoutOptions toLayoutOptions() const;
};

/**
 * @brief Parses `treepro [path] [flags]`
 *
 * Accepts "-f N", "--files N" and "--files=N" forms for every numeric flag.
 *
 * @throws ArgParseError on unknown flags, missing or malformed values,
 *         negative limits or more than one path
 */
CliOptions parseArgs(const std::vector<std::string> &args);

/** @brief Usage text printed for -h/--help */
std::string usageText(const std::string &program);

#endif // ARGPARSER_HPP
