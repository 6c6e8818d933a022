/**
 * @file layout_v1.h
 * @brief Legacy snapshot layout: MsgPack content with no header
 *
 * Kept so regions written before headers existed can still be restored.
 * Content is always decoded at schema version 0.
 */

#pragma once

#include <istream>
#include <ostream>
#include <utility>

#include "migration/decode_context.h"
#include "storage/data_format.h"
#include "storage/restored.h"
#include "system/system_interface.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/structured_log.h"

namespace stashd::storage::layout_v1 {

template <typename T>
utils::Expected<void, utils::Error> Save(const system::SystemInterface& system, std::ostream& out, const T& value) {
  migration::DecodeContext ctx(0);
  auto result = MsgPackAdapter::Serialize(out, value, ctx);
  if (!result) {
    utils::LogStorageError("layout_v1_save", "content", result.error().to_string());
    return result;
  }
  utils::StructuredLog()
      .Event("layout_v1_saved")
      .Field("pre_upgrade_instruction_count", system.InstructionCounter())
      .Info();
  return {};
}

template <typename T>
utils::Expected<Restored<T>, utils::Error> Restore(const system::SystemInterface& system, std::istream& in) {
  migration::DecodeContext ctx(0);
  auto value = MsgPackAdapter::Deserialize<T>(in, ctx);
  if (!value) {
    return utils::MakeUnexpected(value.error());
  }

  auto position = detail::ReadPosition(in);

  Restored<T> restored{};
  restored.header.header_length = 0;
  restored.header.content_length = position < 0 ? 0 : static_cast<uint64_t>(position);
  restored.header.content_format = DataFormatType::kMsgPack;
  restored.transient.post_upgrade_instruction_count = system.InstructionCounter();
  restored.value = std::move(*value);
  restored.layout = LayoutVersion::kV1;

  utils::StructuredLog()
      .Event("layout_v1_restored")
      .Field("content_length", restored.header.content_length)
      .Field("post_upgrade_instruction_count", restored.transient.post_upgrade_instruction_count)
      .Info();
  return restored;
}

}  // namespace stashd::storage::layout_v1
