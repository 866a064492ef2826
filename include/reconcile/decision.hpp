#ifndef K7_RECONCILE_DECISION_HPP
#define K7_RECONCILE_DECISION_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "store/record_store.hpp"

namespace k7 {
namespace reconcile {

enum class DecisionKind {
  Created,
  Updated,
  Skipped
};

enum class SkipReason {
  MissingKey,
  MissingCredential,
  StoreError
};

const char* to_string(DecisionKind kind);
const char* to_string(SkipReason reason);

// Id assigned by the store
struct RealId {
  store::RecordId value = 0;
  bool operator==(const RealId& other) const { return value == other.value; }
};

// Placeholder for a record a dry run would create, numbered from 1 per run
struct PendingId {
  uint64_t sequence = 0;
  bool operator==(const PendingId& other) const { return sequence == other.sequence; }
};

using ResolvedId = std::variant<RealId, PendingId>;

// Store ids as decimal, pending ids negated ("-1", "-2", ...)
std::string to_string(const ResolvedId& id);

// Outcome of one archive entry
struct Decision {
  // 1-based position in the archive
  size_t index = 0;
  // Normalized key, empty when the entry had none
  std::string key;
  DecisionKind kind = DecisionKind::Skipped;
  std::optional<SkipReason> reason;
  // Store error text for Skipped(StoreError)
  std::string detail;
  std::optional<ResolvedId> id;
  // Metadata keys applied, or that would be applied in a dry run
  std::vector<std::string> metadata_keys;
  size_t metadata_failures = 0;
};

struct Summary {
  size_t created = 0;
  size_t updated = 0;
  size_t skipped = 0;

  size_t total() const { return created + updated + skipped; }
  void count(const Decision& decision);

  bool operator==(const Summary& other) const {
    return created == other.created && updated == other.updated && skipped == other.skipped;
  }
};

} // namespace reconcile
} // namespace k7

#endif // K7_RECONCILE_DECISION_HPP
