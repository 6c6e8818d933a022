/**
 * @file layout_v2.h
 * @brief Current snapshot layout: Header followed by encoded content
 *
 * Save reserves room for the header, encodes the content after it, then seeks
 * back and backfills the header once content_length is known. Streams that
 * cannot seek back use SaveBuffered(), which produces the same bytes.
 */

#pragma once

#include <istream>
#include <ostream>
#include <utility>
#include <vector>

#include "migration/decode_context.h"
#include "storage/data_format.h"
#include "storage/header.h"
#include "storage/restored.h"
#include "storage/transient.h"
#include "system/system_interface.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/structured_log.h"

namespace stashd::storage::layout_v2 {

namespace detail {

inline void LogSaveStarted(const system::SystemInterface& system) {
  utils::StructuredLog()
      .Event("layout_v2_save_started")
      .Field("instruction_count", system.InstructionCounter())
      .Info();
}

inline void LogSaveSkipped() {
  utils::StructuredLog().Event("layout_v2_save_skipped").Message("skip_next_save is set").Info();
}

inline void LogSaveFinished(const system::SystemInterface& system, const Header& header) {
  utils::StructuredLog()
      .Event("layout_v2_save_finished")
      .Field("content_length", header.content_length)
      .Field("format", DataFormatTypeToString(header.content_format))
      .Field("schema_version", header.content_schema_version)
      .Field("instruction_count", system.InstructionCounter())
      .Field("memory_usage", system.MemoryUsage())
      .Info();
}

inline utils::Error StreamError(const char* what) {
  return utils::MakeError(utils::ErrorCode::kIoError, what);
}

}  // namespace detail

/**
 * @brief Save @p value with a header into a seekable stream
 *
 * The stream is left positioned at the end of the content.
 *
 * @return Header as written (content_length and instruction count filled in).
 *         When transient.skip_next_save is set nothing is written and the
 *         input header is returned unchanged.
 */
template <typename T>
utils::Expected<Header, utils::Error> Save(const system::SystemInterface& system, std::ostream& out, const T& value,
                                           Header header, const Transient& transient) {
  detail::LogSaveStarted(system);
  if (transient.skip_next_save) {
    detail::LogSaveSkipped();
    return header;
  }

  auto start_pos = out.tellp();
  if (start_pos == std::streampos(-1)) {
    return utils::MakeUnexpected(detail::StreamError("Failed to get stream position"));
  }

  // Placeholder so the content lands at start + NumAllFieldsBytes()
  Header placeholder = header;
  placeholder.content_length = 0;
  if (auto reserved = placeholder.WriteTo(out); !reserved) {
    return utils::MakeUnexpected(reserved.error());
  }

  migration::DecodeContext ctx(header.content_schema_version);
  if (auto encoded = SerdeSerialize(header.content_format, out, value, ctx); !encoded) {
    utils::LogStorageError("layout_v2_save", "content", encoded.error().to_string());
    return utils::MakeUnexpected(encoded.error());
  }

  auto end_pos = out.tellp();
  if (end_pos == std::streampos(-1)) {
    return utils::MakeUnexpected(detail::StreamError("Failed to get stream position"));
  }
  header.header_length = Header::kNumFields;
  header.content_length =
      static_cast<uint64_t>(end_pos - start_pos) - Header::NumAllFieldsBytes();
  header.pre_upgrade_instruction_count = system.InstructionCounter();

  out.seekp(start_pos);
  if (auto written = header.WriteTo(out); !written) {
    return utils::MakeUnexpected(written.error());
  }
  out.seekp(end_pos);
  if (!out.good()) {
    return utils::MakeUnexpected(detail::StreamError("Failed to seek past content"));
  }

  detail::LogSaveFinished(system, header);
  return header;
}

/**
 * @brief Save for append-only streams: encode into memory, then write both parts
 */
template <typename T>
utils::Expected<Header, utils::Error> SaveBuffered(const system::SystemInterface& system, std::ostream& out,
                                                   const T& value, Header header, const Transient& transient) {
  detail::LogSaveStarted(system);
  if (transient.skip_next_save) {
    detail::LogSaveSkipped();
    return header;
  }

  migration::DecodeContext ctx(header.content_schema_version);
  auto content = SerdeSerializeBytes(header.content_format, value, ctx);
  if (!content) {
    utils::LogStorageError("layout_v2_save", "content", content.error().to_string());
    return utils::MakeUnexpected(content.error());
  }

  header.header_length = Header::kNumFields;
  header.content_length = content->size();
  header.pre_upgrade_instruction_count = system.InstructionCounter();

  if (auto written = header.WriteTo(out); !written) {
    return utils::MakeUnexpected(written.error());
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  out.write(reinterpret_cast<const char*>(content->data()), static_cast<std::streamsize>(content->size()));
  if (!out.good()) {
    return utils::MakeUnexpected(detail::StreamError("Failed to write content"));
  }

  detail::LogSaveFinished(system, header);
  return header;
}

/**
 * @brief Restore a value written by Save()/SaveBuffered()
 */
template <typename T>
utils::Expected<Restored<T>, utils::Error> Restore(const system::SystemInterface& system, std::istream& in) {
  utils::StructuredLog()
      .Event("layout_v2_restore_started")
      .Field("instruction_count", system.InstructionCounter())
      .Info();

  auto header = Header::FromReader(in);
  if (!header) {
    return utils::MakeUnexpected(header.error());
  }

  auto content_start = storage::detail::ReadPosition(in);
  utils::StructuredLog()
      .Event("layout_v2_header_read")
      .Field("schema_version", header->content_schema_version)
      .Field("content_start", static_cast<int64_t>(content_start))
      .Info();

  migration::DecodeContext ctx(header->content_schema_version);
  auto value = SerdeDeserialize<T>(header->content_format, in, ctx);
  if (!value) {
    return utils::MakeUnexpected(value.error());
  }

  // Both adapters are self-framing, so a stale content_length does not
  // affect the decoded value; it is reported only.
  auto content_end = storage::detail::ReadPosition(in);
  if (content_start >= 0 && content_end >= 0) {
    auto actual = static_cast<uint64_t>(content_end - content_start);
    if (actual != header->content_length) {
      utils::StructuredLog()
          .Event("layout_v2_content_length_mismatch")
          .Field("expected", header->content_length)
          .Field("actual", actual)
          .Warn();
    }
  }

  Restored<T> restored{};
  restored.header = *header;
  restored.transient.post_upgrade_instruction_count = system.InstructionCounter();
  restored.value = std::move(*value);
  restored.layout = LayoutVersion::kV2;

  utils::StructuredLog()
      .Event("layout_v2_restore_finished")
      .Field("instruction_count", system.InstructionCounter())
      .Field("memory_usage", system.MemoryUsage())
      .Info();
  return restored;
}

}  // namespace stashd::storage::layout_v2
