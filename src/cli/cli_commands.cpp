/**
 * @file cli_commands.cpp
 * @brief stashd-cli commands
 */

#include "cli/cli_commands.h"

#include <spdlog/spdlog.h>

#include <fstream>

#include "storage/data_format.h"
#include "storage/file_util.h"
#include "transfer/chunk_sink.h"
#include "transfer/stable_storage_transfer.h"

namespace stashd::cli {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

utils::Expected<uint64_t, utils::Error> ParseNumber(const std::string& option, const std::string& value) {
  try {
    size_t consumed = 0;
    uint64_t parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid value for " + option + ": " + value));
    }
    return parsed;
  } catch (const std::exception&) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid value for " + option + ": " + value));
  }
}

void PrintHeader(const storage::Header& header, std::ostream& out) {
  out << "header_length: " << header.header_length << "\n";
  out << "content_length: " << header.content_length << "\n";
  out << "content_format: " << storage::DataFormatTypeToString(header.content_format) << "\n";
  out << "content_schema_version: " << header.content_schema_version << "\n";
  out << "pre_upgrade_instruction_count: " << header.pre_upgrade_instruction_count << "\n";
}

utils::Expected<void, utils::Error> RequireArgs(const std::vector<std::string>& command, size_t count,
                                                const std::string& usage) {
  if (command.size() < count) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Usage: " + usage));
  }
  return {};
}

utils::Expected<void, utils::Error> CommandInfo(const agent::CanisterAgent& agent, const config::Config& config,
                                                std::ostream& out) {
  transfer::StableStorageTransfer transfer(agent, config.transfer);
  auto info = transfer.GetStableStorageInfo();
  if (!info) {
    return MakeUnexpected(info.error());
  }
  PrintHeader(info->first, out);
  out << "skip_next_save: " << (info->second.skip_next_save ? "true" : "false") << "\n";
  out << "post_upgrade_instruction_count: " << info->second.post_upgrade_instruction_count << "\n";
  return {};
}

utils::Expected<void, utils::Error> CommandBackup(const agent::CanisterAgent& agent, const config::Config& config,
                                                  const std::vector<std::string>& command, std::ostream& out) {
  auto ok = RequireArgs(command, 2, "backup <file|->");
  if (!ok) {
    return ok;
  }
  transfer::StableStorageTransfer transfer(agent, config.transfer);

  std::string path = command[1];
  if (path == "-") {
    auto name = transfer.GetDefaultBackupFileName(agent.CanisterId());
    if (!name) {
      return MakeUnexpected(name.error());
    }
    path = *name;
  }

  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output) {
    return MakeUnexpected(storage::detail::OpenError(path, "writing"));
  }
  transfer::StreamChunkSink sink(output);
  auto received = transfer.Backup(sink);
  if (!received) {
    return MakeUnexpected(utils::WithContext(received.error(), path));
  }
  out << "Backed up " << *received << " bytes to " << path << "\n";
  return {};
}

utils::Expected<void, utils::Error> CommandRestore(const agent::CanisterAgent& agent, const config::Config& config,
                                                   const std::vector<std::string>& command, bool compressed,
                                                   std::ostream& out) {
  auto ok = RequireArgs(command, 2,
                        compressed ? "restore-compressed <file> [--level N]" : "restore <file> [--offset N]");
  if (!ok) {
    return ok;
  }

  std::optional<uint64_t> offset;
  int level = utils::kDefaultGzipLevel;
  for (size_t i = 2; i < command.size(); ++i) {
    const std::string& option = command[i];
    if (i + 1 >= command.size()) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, option + " requires an argument"));
    }
    auto value = ParseNumber(option, command[++i]);
    if (!value) {
      return MakeUnexpected(value.error());
    }
    if (option == "--offset" && !compressed) {
      offset = *value;
    } else if (option == "--level" && compressed) {
      level = static_cast<int>(*value);
    } else {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + option));
    }
  }

  const std::string& path = command[1];
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return MakeUnexpected(storage::detail::OpenError(path, "reading"));
  }

  transfer::StableStorageTransfer transfer(agent, config.transfer);
  auto restored = compressed ? transfer.RestoreCompressed(input, level) : transfer.Restore(input, offset);
  if (!restored) {
    return MakeUnexpected(utils::WithContext(restored.error(), path));
  }
  out << "Restored " << path << "\n";
  return {};
}

utils::Expected<void, utils::Error> CommandInspect(const std::vector<std::string>& command, std::ostream& out) {
  auto ok = RequireArgs(command, 2, "inspect <file>");
  if (!ok) {
    return ok;
  }
  auto header = storage::ReadFileHeader(command[1]);
  if (!header) {
    return MakeUnexpected(header.error());
  }
  PrintHeader(*header, out);
  out << "total_bytes: " << header->NumContentAndHeaderBytes() << "\n";
  return {};
}

}  // namespace

utils::Expected<CliOptions, utils::Error> ParseArgs(const std::vector<std::string>& args) {
  CliOptions options;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help") {
      options.help = true;
      return options;
    }
    if (arg == "-c" || arg == "--config" || arg == "--host" || arg == "--port") {
      if (i + 1 >= args.size()) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, arg + " requires an argument"));
      }
      const std::string& value = args[++i];
      if (arg == "--host") {
        options.host = value;
      } else if (arg == "--port") {
        auto port = ParseNumber(arg, value);
        if (!port) {
          return MakeUnexpected(port.error());
        }
        options.port = static_cast<int>(*port);
      } else {
        options.config_path = value;
      }
      continue;
    }
    // Remaining args are the command
    options.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    break;
  }
  if (options.command.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No command given"));
  }
  return options;
}

utils::Expected<config::Config, utils::Error> ResolveConfig(const CliOptions& options) {
  config::Config config;
  if (!options.config_path.empty()) {
    auto loaded = config::LoadConfig(options.config_path);
    if (!loaded) {
      return MakeUnexpected(loaded.error());
    }
    config = *loaded;
  }
  config.agent.type = "http";
  if (options.host) {
    config.agent.host = *options.host;
  }
  if (options.port) {
    config.agent.port = *options.port;
  }
  return config;
}

utils::Expected<void, utils::Error> RunCommand(const agent::CanisterAgent& agent, const config::Config& config,
                                               const std::vector<std::string>& command, std::ostream& out) {
  if (command.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No command given"));
  }
  const std::string& name = command[0];
  spdlog::debug("Running command {}", name);

  if (name == "info") {
    return CommandInfo(agent, config, out);
  }
  if (name == "backup") {
    return CommandBackup(agent, config, command, out);
  }
  if (name == "restore") {
    return CommandRestore(agent, config, command, false, out);
  }
  if (name == "restore-compressed") {
    return CommandRestore(agent, config, command, true, out);
  }
  if (name == "inspect") {
    return CommandInspect(command, out);
  }
  return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown command: " + name));
}

void PrintUsage(const std::string& program, std::ostream& out) {
  out << "Usage: " << program << " [-c config.yaml] [--host H] [--port P] <command> [args]\n";
  out << "\n";
  out << "Commands:\n";
  out << "  info                                  Show the remote header and transient state\n";
  out << "  backup <file|->                       Download stable storage ('-' picks a default name)\n";
  out << "  restore <file> [--offset N]           Upload a backup, optionally resuming at byte N\n";
  out << "  restore-compressed <file> [--level N] Upload a backup with gzip-compressed windows\n";
  out << "  inspect <file>                        Print the header of a local backup\n";
}

}  // namespace stashd::cli
