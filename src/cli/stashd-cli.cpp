/**
 * @file stashd-cli.cpp
 * @brief Backup/restore client for a stashd daemon
 */

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

#include "agent/canister_agent.h"
#include "cli/cli_commands.h"

int main(int argc, char* argv[]) {
  spdlog::set_level(spdlog::level::warn);

  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }

  auto options = stashd::cli::ParseArgs(args);
  if (!options) {
    std::cerr << "Error: " << options.error().to_string() << '\n';
    stashd::cli::PrintUsage(argv[0], std::cerr);
    return 1;
  }
  if (options->help) {
    stashd::cli::PrintUsage(argv[0], std::cout);
    return 0;
  }

  auto config = stashd::cli::ResolveConfig(*options);
  if (!config) {
    std::cerr << "Error: " << config.error().to_string() << '\n';
    return 1;
  }
  spdlog::set_level(spdlog::level::from_str(config->logging.level));

  auto agent = stashd::agent::CanisterAgent::Create(config->agent, nullptr);
  if (!agent) {
    std::cerr << "Error: " << agent.error().to_string() << '\n';
    return 1;
  }

  auto result = stashd::cli::RunCommand(*agent, *config, options->command, std::cout);
  if (!result) {
    std::cerr << "Error: " << result.error().to_string() << '\n';
    return 1;
  }
  return 0;
}
