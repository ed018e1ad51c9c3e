#include "cli.h"
#include "termination.h"
#include "tui.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  mise::tui::init();
  mise::termination_handler_install();

  auto args{ mise::cli_parse(argc, argv) };
  try {
    mise::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    std::fprintf(stderr, "mise: %s\n", ex.what());
    return EXIT_FAILURE;
  }
  mise::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      mise::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    mise::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return mise::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    mise::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
