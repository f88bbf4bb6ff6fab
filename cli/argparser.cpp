#include "argparser.hpp"

#include <optional>

namespace {

std::optional<std::size_t> boundFromFlag(std::size_t value) {
  if (value == 0)
    return std::nullopt;
  return value;
}

// Parses the value of a numeric flag; @p flag is the long name for messages.
std::size_t parseLimit(const std::string &flag, const std::string &value) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::invalid_argument &) {
    throw ArgParseError("invalid argument \"" + value + "\" for " + flag);
  } catch (const std::out_of_range &) {
    throw ArgParseError("value out of range for " + flag + ": " + value);
  }
  if (consumed != value.size())
    throw ArgParseError("invalid argument \"" + value + "\" for " + flag);
  if (parsed < 0)
    throw ArgParseError(flag + " must be >= 0");
  return static_cast<std::size_t>(parsed);
}

} // namespace

WalkOptions CliOptions::toWalkOptions() const {
  WalkOptions options;
  options.maxFilesPerDir = boundFromFlag(maxFiles);
  options.maxDepth = boundFromFlag(maxLevel);
  return options;
}

LayoutOptions CliOptions::toLayoutOptions() const {
  LayoutOptions options;
  options.maxDirsPerGroup = boundFromFlag(maxDirs);
  return options;
}

CliOptions parseArgs(const std::vector<std::string> &args) {
  CliOptions options;
  std::vector<std::string> positional;
  bool flagsDone = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (flagsDone || arg.empty() || arg[0] != '-') {
      positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      flagsDone = true;
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      options.showHelp = true;
      continue;
    }
    if (arg == "--no-color") {
      options.noColor = true;
      continue;
    }

    // Numeric flags: "-f N", "--files N", "--files=N"
    std::string name = arg;
    std::optional<std::string> inlineValue;
    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      name = arg.substr(0, eq);
      inlineValue = arg.substr(eq + 1);
    }

    std::size_t *target = nullptr;
    std::string longName;
    if (name == "-f" || name == "--files") {
      target = &options.maxFiles;
      longName = "--files";
    } else if (name == "-d" || name == "--dirs") {
      target = &options.maxDirs;
      longName = "--dirs";
    } else if (name == "-L" || name == "--level") {
      target = &options.maxLevel;
      longName = "--level";
    } else {
      throw ArgParseError("unknown flag: " + arg);
    }

    std::string value;
    if (inlineValue) {
      value = *inlineValue;
    } else if (i + 1 < args.size()) {
      value = args[++i];
    } else {
      throw ArgParseError("flag needs an argument: " + arg);
    }
    *target = parseLimit(longName, value);
  }

  if (positional.size() > 1)
    throw ArgParseError("accepts at most 1 arg(s), received " +
                        std::to_string(positional.size()));
  if (!positional.empty())
    options.path = positional.front();

  return options;
}

std::string usageText(const std::string &program) {
  return "Print a concise, colored directory tree\n"
         "\n"
         "Usage:\n"
         "  " + program + " [path] [flags]\n"
         "\n"
         "Flags:\n"
         "  -f, --files N   maximum files to display per directory (0 for unlimited, default 5)\n"
         "  -d, --dirs N    maximum identical directories to expand per group (0 for unlimited, default 1)\n"
         "  -L, --level N   maximum recursion depth (0 for unlimited, default 0)\n"
         "      --no-color  disable colored output\n"
         "  -h, --help      show this help\n";
}
