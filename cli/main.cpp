#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "argparser.hpp"
#include "interruptguard.hpp"
#include "log.hpp"
#include "sha256.hpp"
#include "treeprinter.hpp"
#include "treerenderer.hpp"
#include "treewalker.hpp"
#include "utils.hpp"

namespace {

std::atomic<bool> g_cancelled{false};

} // namespace

/**
 * @class Application
 * @brief Walks the requested directory and prints its condensed tree
 *
 * Responsibilities
 *  - Build a TreeWalker (with a SHA-256 hasher for signatures) and walk the
 *    cleaned target path with the file and depth limits from the CLI.
 *  - Print the result either colored through FTXUI or as plain text.
 *
 * Ctrl-C cancels the walk; once the walk is done the default SIGINT
 * behavior is back, so an interrupted render simply terminates.
 *
 * Color is used only when stdout is a terminal, NO_COLOR is unset and
 * --no-color was not given.
 *
 * Error handling
 *  - TreeWalkError and digest failures propagate to main(), which maps them
 *    to exit codes.
 */
class Application {
private:
  CliOptions m_options;

  bool useColor() const {
    if (m_options.noColor)
      return false;
    const char *noColor = std::getenv("NO_COLOR");
    if (noColor && *noColor)
      return false;
    return isatty(STDOUT_FILENO) == 1;
  }

public:
  explicit Application(const CliOptions &options) : m_options(options) {}

  void run() {
    Sha256 hasher;
    TreeWalker walker(hasher);
    walker.setCancelFlag(&g_cancelled);

    const std::string target = cleanPath(m_options.path);
    DirectoryNode root;
    {
      InterruptGuard interrupts(g_cancelled);
      if (!interrupts.installed())
        TP_LOGW("cannot install SIGINT handler; Ctrl-C will not cancel cleanly");

      root = walker.walk(target, m_options.toWalkOptions(),
                         [](std::size_t visited) {
                           if (visited % 1000 == 0)
                             TP_LOGI("%zu directories read", visited);
                         });
    }

    const std::string label = formatRootLabel(m_options.path);
    if (useColor()) {
      TreeRenderer::render(std::cout, label, root, m_options.toLayoutOptions());
    } else {
      TreePrinter::print(std::cout, label, root, m_options.toLayoutOptions());
    }
    std::cout.flush();
  }
};

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "treepro";
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions options;
  try {
    options = parseArgs(args);
  } catch (const ArgParseError &e) {
    std::cerr << "Error: " << e.what() << "\n"
              << "Run '" << program << " --help' for usage." << std::endl;
    return 1;
  }

  if (options.showHelp) {
    std::cout << usageText(program);
    return 0;
  }

  try {
    Application app(options);
    app.run();
  } catch (const TreeWalkError &e) {
    if (e.getKind() == WalkErrorKind::Cancelled) {
      std::cerr << "Interrupted." << std::endl;
      return 130;
    }
    TP_LOGE("walk failed: %s", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    TP_LOGE("unexpected failure: %s", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
