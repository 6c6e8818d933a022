/**
 * @file decode_context.h
 * @brief Schema version in effect for one encode/decode pass
 *
 * Every archive carries a DecodeContext. Layouts create one per save/restore
 * from the header's content_schema_version, so two decodes running on
 * different threads never observe each other's version.
 */

#pragma once

#include <cstdint>

namespace stashd::migration {

/**
 * @brief Active schema version for versioned-field decisions
 *
 * Read by the versioned-field combinators (AddedIn, RemovedIn, ChangedIn...)
 * both when encoding (to omit removed fields) and when decoding (to pick the
 * legacy or current decode path).
 */
class DecodeContext {
 public:
  DecodeContext() = default;
  explicit DecodeContext(uint64_t schema_version) : schema_version_(schema_version) {}

  void SetActiveVersion(uint64_t version) { schema_version_ = version; }
  uint64_t ActiveVersion() const { return schema_version_; }

 private:
  uint64_t schema_version_ = 0;
};

}  // namespace stashd::migration
