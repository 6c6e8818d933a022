/**
 * @file transient.h
 * @brief Per-process state that is never written into the region
 */

#pragma once

#include <cstdint>

namespace stashd::storage {

struct Transient {
  /// Set after a restore so the next save does not overwrite the restored region
  bool skip_next_save = false;
  /// Instruction counter sampled right after restore
  uint64_t post_upgrade_instruction_count = 0;

  bool operator==(const Transient& other) const {
    return skip_next_save == other.skip_next_save &&
           post_upgrade_instruction_count == other.post_upgrade_instruction_count;
  }
  bool operator!=(const Transient& other) const { return !(*this == other); }
};

template <typename Archive>
void Serialize(Archive& ar, Transient& transient) {
  ar("skip_next_save", transient.skip_next_save);
  ar("post_upgrade_instruction_count", transient.post_upgrade_instruction_count);
}

}  // namespace stashd::storage
