/**
 * @file file_util.h
 * @brief Save/restore snapshots to local files
 *
 * Files use the V2 layout. Writes go to "<path>.tmp" and are renamed onto
 * the final path once complete, so a failed save never leaves a truncated
 * snapshot under @p path.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "storage/header.h"
#include "storage/layout.h"
#include "storage/restored.h"
#include "storage/transient.h"
#include "system/system_interface.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/structured_log.h"

namespace stashd::storage {

namespace detail {

inline utils::Error OpenError(const std::string& path, const char* mode) {
  return utils::MakeError(utils::ErrorCode::kIoError,
                          std::string("Failed to open file for ") + mode + ": " + path + " (" + std::strerror(errno) +
                              ")");
}

}  // namespace detail

/**
 * @brief Write @p value to @p path using the V2 layout
 *
 * Nothing is written when transient.skip_next_save is set.
 */
template <typename T>
utils::Expected<Header, utils::Error> SaveToFile(const system::SystemInterface& system, const std::string& path,
                                                 const T& value, const Header& header, const Transient& transient) {
  if (transient.skip_next_save) {
    utils::LogStorageInfo("file_save", "skip_next_save is set, not writing " + path);
    return header;
  }

  std::string temp_path = path + ".tmp";
  std::ofstream output_stream(temp_path, std::ios::binary | std::ios::trunc);
  if (!output_stream) {
    return utils::MakeUnexpected(detail::OpenError(temp_path, "writing"));
  }

  try {
    auto written = layout_v2::Save(system, output_stream, value, header, transient);
    if (!written) {
      output_stream.close();
      std::filesystem::remove(temp_path);
      return written;
    }
    output_stream.close();
    if (output_stream.fail()) {
      std::filesystem::remove(temp_path);
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIoError, "Failed to close " + temp_path));
    }

    std::filesystem::rename(temp_path, path);
    utils::LogStorageInfo("file_save", "Snapshot written to " + path);
    return written;
  } catch (const std::filesystem::filesystem_error& e) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kIoError, std::string("Snapshot write failed: ") + e.what(), path));
  }
}

/**
 * @brief Restore a V2 snapshot file
 */
template <typename T>
utils::Expected<Restored<T>, utils::Error> RestoreFromFile(const system::SystemInterface& system,
                                                           const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return utils::MakeUnexpected(detail::OpenError(path, "reading"));
  }
  return layout_v2::Restore<T>(system, input_stream);
}

/**
 * @brief Restore a file written with either layout
 */
template <typename T>
utils::Expected<Restored<T>, utils::Error> RestoreFromFileV1V2(const system::SystemInterface& system,
                                                               const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return utils::MakeUnexpected(detail::OpenError(path, "reading"));
  }
  return RestoreV1V2<T>(system, input_stream);
}

/**
 * @brief Read only the header of a snapshot file
 */
inline utils::Expected<Header, utils::Error> ReadFileHeader(const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return utils::MakeUnexpected(detail::OpenError(path, "reading"));
  }
  return Header::FromReader(input_stream);
}

}  // namespace stashd::storage
