/**
 * @file cli_commands.h
 * @brief stashd-cli command line parsing and commands
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "agent/canister_agent.h"
#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::cli {

/**
 * @brief Parsed command line
 */
struct CliOptions {
  std::string config_path;          ///< -c; empty uses built-in defaults
  std::optional<std::string> host;  ///< --host override
  std::optional<int> port;          ///< --port override
  std::vector<std::string> command;  ///< Command and its arguments
  bool help = false;
};

utils::Expected<CliOptions, utils::Error> ParseArgs(const std::vector<std::string>& args);

/**
 * @brief Configuration the CLI runs with: file (if any) plus overrides
 *
 * The CLI has no local service, so the agent is always the HTTP backend.
 */
utils::Expected<config::Config, utils::Error> ResolveConfig(const CliOptions& options);

/**
 * @brief Run one command
 *
 * Commands:
 *   info
 *   backup <file|->                 "-" picks the default backup file name
 *   restore <file> [--offset N]
 *   restore-compressed <file> [--level N]
 *   inspect <file>                  local only, no agent call
 */
utils::Expected<void, utils::Error> RunCommand(const agent::CanisterAgent& agent, const config::Config& config,
                                               const std::vector<std::string>& command, std::ostream& out);

void PrintUsage(const std::string& program, std::ostream& out);

}  // namespace stashd::cli
