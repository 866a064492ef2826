#include "reconcile/decision.hpp"

namespace k7 {
namespace reconcile {

const char* to_string(DecisionKind kind) {
  switch (kind) {
    case DecisionKind::Created: return "Created";
    case DecisionKind::Updated: return "Updated";
    case DecisionKind::Skipped: return "Skipped";
    default:                    return "Unknown";
  }
}

const char* to_string(SkipReason reason) {
  switch (reason) {
    case SkipReason::MissingKey:        return "Missing key";
    case SkipReason::MissingCredential: return "Missing credential";
    case SkipReason::StoreError:        return "Store error";
    default:                            return "Unknown";
  }
}

std::string to_string(const ResolvedId& id) {
  if (const auto* real = std::get_if<RealId>(&id)) {
    return std::to_string(real->value);
  }
  return "-" + std::to_string(std::get<PendingId>(id).sequence);
}

void Summary::count(const Decision& decision) {
  switch (decision.kind) {
    case DecisionKind::Created: ++created; break;
    case DecisionKind::Updated: ++updated; break;
    case DecisionKind::Skipped: ++skipped; break;
  }
}

} // namespace reconcile
} // namespace k7
