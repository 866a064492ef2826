#ifndef K7_RECONCILE_RECONCILER_HPP
#define K7_RECONCILE_RECONCILER_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "oplog/operation_log.hpp"
#include "reconcile/decision.hpp"
#include "record/record.hpp"
#include "store/record_store.hpp"

namespace k7 {
namespace reconcile {

struct ReconcilerOptions {
  // Metadata key whose presence replaces the record's roles instead of
  // merging into them
  std::string role_key = store::DEFAULT_ROLE_KEY;
  // Source of the default registration time, system clock when empty
  std::function<std::chrono::system_clock::time_point()> clock;
};

struct ReconcileResult {
  Summary summary;
  // One per archive entry, in archive order
  std::vector<Decision> decisions;
};

// Walks parsed records in archive order and creates, updates or skips each
// against the store. A failing entry never stops the walk: store errors are
// caught per entry and reported as Skipped(StoreError). In a dry run every
// decision is made and logged but the store is only read.
//
// There is no transaction around the walk; entries applied before a later
// failure stay applied.
class Reconciler {
public:
  // ---- CONSTRUCTOR ----
  Reconciler(store::RecordStore& store, oplog::OperationLog& log,
             ReconcilerOptions options = ReconcilerOptions());


  // ---- RECONCILIATION ----
  ReconcileResult apply(const record::RecordList& records, bool dry_run);

private:
  // ---- PARAMETERS ----
  store::RecordStore& store_;
  oplog::OperationLog& log_;
  ReconcilerOptions options_;


  // ---- PER RECORD STEPS ----
  Decision reconcile_one(const record::Record& incoming, size_t index, bool dry_run,
                         uint64_t& next_pending);
  void apply_metadata(const record::Record& incoming, Decision& decision, bool dry_run,
                      const std::string& prefix);
  std::chrono::system_clock::time_point now() const;
};

} // namespace reconcile
} // namespace k7

#endif // K7_RECONCILE_RECONCILER_HPP
