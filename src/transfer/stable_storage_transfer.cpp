/**
 * @file stable_storage_transfer.cpp
 * @brief Backup/restore orchestration
 */

#include "transfer/stable_storage_transfer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <memory>

#include "service/service_types.h"
#include "utils/structured_log.h"

namespace stashd::transfer {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr uint64_t kNanosPerSecond = 1000000000ULL;

std::string OffsetContext(uint64_t offset) {
  return "offset " + std::to_string(offset);
}

}  // namespace

StableStorageTransfer::StableStorageTransfer(agent::CanisterAgent agent, const config::TransferConfig& config,
                                             RetryPolicy::Sleeper sleeper)
    : agent_(std::move(agent)), config_(config), retry_(config.retry, std::move(sleeper)) {}

utils::Expected<std::pair<storage::Header, storage::Transient>, utils::Error>
StableStorageTransfer::GetStableStorageInfo() const {
  auto args = service::EncodeArgs();
  if (!args) {
    return MakeUnexpected(args.error());
  }
  auto reply = agent_.Query(service::methods::kStableStorageInfo, *args);
  if (!reply) {
    return MakeUnexpected(reply.error());
  }
  auto decoded = service::DecodeArgs<storage::Header, storage::Transient>(*reply);
  if (!decoded) {
    return MakeUnexpected(decoded.error());
  }
  return std::make_pair(std::get<0>(*decoded), std::get<1>(*decoded));
}

utils::Expected<Bytes, utils::Error> StableStorageTransfer::FetchWindow(uint64_t offset, uint64_t len,
                                                                       uint64_t total) const {
  spdlog::debug("Fetching {} of {}", offset, total);
  return agent_.QueryTyped<Bytes>(service::methods::kBackupStableStorage, offset, len);
}

utils::Expected<uint64_t, utils::Error> StableStorageTransfer::Drive(const char* direction, uint64_t total,
                                                                     const WindowSource& next,
                                                                     const ResultHandler& on_result) {
  ChunkDispatcher dispatcher(static_cast<size_t>(config_.max_in_flight));
  CancelCheck should_stop = [this, &dispatcher] { return cancelled_.load() || dispatcher.IsCancelled(); };

  std::optional<utils::Error> failure;
  uint64_t completed = 0;

  auto fail = [&](const utils::Error& error) {
    failure = error;
    dispatcher.Cancel();
  };

  // After the first failure the remaining completions are drained and dropped
  auto handle = [&](ChunkDispatcher::Completion& completion) {
    if (failure) {
      return;
    }
    if (!completion.result) {
      utils::LogTransferChunkFailure(direction, completion.offset, total, completion.result.error().to_string());
      fail(completion.result.error());
      return;
    }
    auto handled = on_result(completion.offset, *completion.result);
    if (!handled) {
      utils::LogTransferChunkFailure(direction, completion.offset, total, handled.error().to_string());
      fail(handled.error());
      return;
    }
    ++completed;
  };

  while (!failure) {
    while (auto completion = dispatcher.TryNext()) {
      handle(*completion);
    }
    if (failure) {
      break;
    }
    if (cancelled_) {
      fail(MakeError(ErrorCode::kTransferCancelled, "Transfer cancelled", direction));
      break;
    }

    auto window = next();
    if (!window) {
      fail(window.error());
      break;
    }
    if (!window->has_value()) {
      break;
    }

    auto run = std::move((*window)->run);
    uint64_t offset = (*window)->offset;
    if (!dispatcher.Submit(offset, [run, should_stop] { return run(should_stop); })) {
      break;
    }
  }

  while (auto completion = dispatcher.WaitNext()) {
    handle(*completion);
  }

  if (failure) {
    return MakeUnexpected(*failure);
  }
  return completed;
}

utils::Expected<uint64_t, utils::Error> StableStorageTransfer::Backup(ChunkSink& sink) {
  cancelled_ = false;
  auto start = std::chrono::steady_clock::now();

  auto info = GetStableStorageInfo();
  if (!info) {
    return MakeUnexpected(info.error());
  }
  const storage::Header& header = info->first;
  if (header.content_format == storage::DataFormatType::kUnknown) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStableStorageNotInitialized, "Canister stable storage not initialized"));
  }

  const uint64_t total = storage::Header::NumAllFieldsBytes() + header.content_length;
  const uint64_t window = config_.backup_chunk_size;
  const uint64_t count = total / window + 1;
  spdlog::info("Backing up {} bytes in {} windows", total, count);

  uint64_t index = 0;
  WindowSource next = [&]() -> utils::Expected<std::optional<Window>, utils::Error> {
    // The last window may start at total; it has nothing to fetch
    while (index < count) {
      uint64_t offset = index * window;
      ++index;
      if (offset >= total) {
        continue;
      }
      uint64_t len = std::min(window, total - offset);
      Window w;
      w.offset = offset;
      w.run = [this, offset, len, total](const CancelCheck& should_stop) {
        return retry_.Run([&] { return FetchWindow(offset, len, total); }, OffsetContext(offset), should_stop);
      };
      return std::optional<Window>(std::move(w));
    }
    return std::optional<Window>();
  };

  uint64_t received = 0;
  ResultHandler on_result = [&](uint64_t offset, const Bytes& bytes) -> utils::Expected<void, utils::Error> {
    received += bytes.size();
    return sink.WriteChunk(offset, bytes);
  };

  auto chunks = Drive("backup", total, next, on_result);
  if (!chunks) {
    return MakeUnexpected(chunks.error());
  }

  if (received != total) {
    return MakeUnexpected(MakeError(ErrorCode::kBackupLengthMismatch, "Backup length mismatch expected " +
                                                                          std::to_string(total) + " actual " +
                                                                          std::to_string(received)));
  }
  auto flushed = sink.Flush();
  if (!flushed) {
    return MakeUnexpected(flushed.error());
  }

  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  utils::LogTransferComplete("backup", received, *chunks, elapsed);
  return received;
}

utils::Expected<void, utils::Error> StableStorageTransfer::Restore(std::istream& in,
                                                                   std::optional<uint64_t> restore_offset) {
  return RestoreImpl(in, restore_offset, std::nullopt);
}

utils::Expected<void, utils::Error> StableStorageTransfer::RestoreCompressed(std::istream& in, int level) {
  return RestoreImpl(in, std::nullopt, level);
}

utils::Expected<void, utils::Error> StableStorageTransfer::RestoreImpl(std::istream& in,
                                                                       std::optional<uint64_t> restore_offset,
                                                                       std::optional<int> compression_level) {
  cancelled_ = false;
  auto start = std::chrono::steady_clock::now();
  const char* direction = compression_level ? "restore_compressed" : "restore";

  auto header = storage::Header::FromReader(in);
  if (!header) {
    return MakeUnexpected(header.error());
  }
  // A backup with a shorter declared header is rewritten in the current
  // layout, so content always starts right after all header fields.
  const Bytes header_bytes = header->ToBytes();
  const auto header_len = static_cast<uint64_t>(header_bytes.size());
  const uint64_t len = header_len + header->content_length;

  // Grow the remote region to hold everything first
  auto init = agent_.UpdateUnit(service::methods::kInitStableStorage, len);
  if (!init) {
    return init;
  }
  const uint64_t offset_start = restore_offset.value_or(header_len);
  if (offset_start < header_len) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Restore offset " + std::to_string(offset_start) + " is inside the header"));
  }

  // Resuming: content before the resume point was uploaded by an earlier run
  if (offset_start > header_len) {
    const uint64_t skip = offset_start - header_len;
    in.ignore(static_cast<std::streamsize>(skip));
    if (static_cast<uint64_t>(in.gcount()) != skip) {
      return MakeUnexpected(MakeError(ErrorCode::kIoError, "Backup is shorter than the restore offset",
                                      OffsetContext(offset_start)));
    }
  }

  auto header_upload = retry_.Run(
      [&] {
        spdlog::debug("Restoring header");
        return agent_.UpdateUnit(service::methods::kRestoreStableStorage, uint64_t{0}, header_bytes);
      },
      OffsetContext(0), [this] { return cancelled_.load(); });
  if (!header_upload) {
    return header_upload;
  }

  const uint64_t window = config_.restore_chunk_size;
  uint64_t offset = offset_start;
  WindowSource next = [&]() -> utils::Expected<std::optional<Window>, utils::Error> {
    if (offset >= len) {
      return std::optional<Window>();
    }
    uint64_t size = std::min(window, len - offset);
    auto buffer = std::make_shared<Bytes>(size);
    in.read(reinterpret_cast<char*>(buffer->data()), static_cast<std::streamsize>(size));
    if (static_cast<uint64_t>(in.gcount()) != size) {
      return MakeUnexpected(MakeError(ErrorCode::kIoError,
                                      "Backup ended early: wanted " + std::to_string(size) + " bytes, got " +
                                          std::to_string(in.gcount()),
                                      OffsetContext(offset)));
    }

    Window w;
    w.offset = offset;
    const uint64_t at = offset;
    const int level = compression_level.value_or(0);
    const bool compressed = compression_level.has_value();
    w.run = [this, buffer, at, len, level,
             compressed](const CancelCheck& should_stop) -> utils::Expected<Bytes, utils::Error> {
      if (compressed) {
        auto gz = utils::GzipCompress(*buffer, level);
        if (!gz) {
          return MakeUnexpected(utils::WithContext(gz.error(), OffsetContext(at)));
        }
        std::vector<Bytes> elements{std::move(*gz)};
        auto uploaded = retry_.Run(
            [&] {
              spdlog::debug("Restoring {} of {} (compressed)", at, len);
              return agent_.UpdateUnit(service::methods::kRestoreStableStorageCompressed, at, elements);
            },
            OffsetContext(at), should_stop);
        if (!uploaded) {
          return MakeUnexpected(uploaded.error());
        }
        return Bytes{};
      }
      auto uploaded = retry_.Run(
          [&] {
            spdlog::debug("Restoring {} of {}", at, len);
            return agent_.UpdateUnit(service::methods::kRestoreStableStorage, at, *buffer);
          },
          OffsetContext(at), should_stop);
      if (!uploaded) {
        return MakeUnexpected(uploaded.error());
      }
      return Bytes{};
    };
    offset += size;
    return std::optional<Window>(std::move(w));
  };

  ResultHandler on_result = [](uint64_t, const Bytes&) -> utils::Expected<void, utils::Error> { return {}; };

  auto chunks = Drive(direction, len, next, on_result);
  if (!chunks) {
    return MakeUnexpected(chunks.error());
  }

  auto flagged = agent_.UpdateUnit(service::methods::kSetRestoreFromStableStorage, true);
  if (!flagged) {
    return flagged;
  }

  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  utils::LogTransferComplete(direction, len - offset_start, *chunks, elapsed);
  return {};
}

utils::Expected<std::string, utils::Error> StableStorageTransfer::GetDefaultBackupFileName(
    const std::string& prefix) const {
  auto stats = agent_.CanisterStats();
  if (!stats) {
    return MakeUnexpected(stats.error());
  }

  auto seconds = static_cast<std::time_t>(stats->last_upgraded / kNanosPerSecond);
  std::tm tm{};
  if (gmtime_r(&seconds, &tm) == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Invalid last_upgraded timestamp " + std::to_string(stats->last_upgraded)));
  }
  char time_buf[32];
  size_t written = std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d_%H-%M-%S", &tm);
  return prefix + "_" + stats->version + "_" + std::string(time_buf, written);
}

}  // namespace stashd::transfer
