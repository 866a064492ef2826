#include "reconcile/reconciler.hpp"
#include <boost/log/trivial.hpp>
#include "record/sanitize.hpp"

namespace k7 {
namespace reconcile {

using oplog::Severity;

//==============================================
// CONSTRUCTOR
//==============================================

Reconciler::Reconciler(store::RecordStore& store, oplog::OperationLog& log, ReconcilerOptions options)
  : store_(store)
  , log_(log)
  , options_(std::move(options)) {}


//==============================================
// RECONCILIATION
//==============================================

ReconcileResult Reconciler::apply(const record::RecordList& records, bool dry_run) {
  BOOST_LOG_TRIVIAL(info) << "Reconciler: Applying " << records.size() << " records"
                          << (dry_run ? " (dry run)" : "");

  ReconcileResult result;
  result.decisions.reserve(records.size());
  uint64_t next_pending = 1;

  for (size_t i = 0; i < records.size(); ++i) {
    Decision decision = reconcile_one(records[i], i + 1, dry_run, next_pending);
    result.summary.count(decision);
    result.decisions.push_back(std::move(decision));
  }

  BOOST_LOG_TRIVIAL(info) << "Reconciler: Created " << result.summary.created
                          << ", updated " << result.summary.updated
                          << ", skipped " << result.summary.skipped;
  return result;
}


//==============================================
// PER RECORD STEPS
//==============================================

Decision Reconciler::reconcile_one(const record::Record& incoming, size_t index, bool dry_run,
                                   uint64_t& next_pending) {
  Decision decision;
  decision.index = index;
  std::string prefix = "Processing record entry #" + std::to_string(index) + ": ";

  decision.key = record::normalize_key(incoming.key);
  if (decision.key.empty()) {
    decision.reason = SkipReason::MissingKey;
    log_.append(prefix + "Skipped - missing key.", Severity::Warning);
    return decision;
  }
  prefix += decision.key + " - ";

  if (!incoming.credential_hash && !dry_run) {
    decision.reason = SkipReason::MissingCredential;
    log_.append(prefix + "Skipped - missing credential hash.", Severity::Warning);
    return decision;
  }

  record::Record request = record::make_store_request(incoming, decision.key, now());
  std::string action = "looking up record";

  try {
    std::optional<store::StoredRecord> existing = store_.find_by_key(decision.key);

    if (existing) {
      action = "updating record";
      if (dry_run) {
        log_.append(prefix + "DRY RUN: Would update existing record (ID: " + std::to_string(existing->id) + ").",
                    Severity::Info);
      } else {
        store_.update(existing->id, request);
        log_.append(prefix + "Successfully updated existing record (ID: " + std::to_string(existing->id) + ").",
                    Severity::Success);
      }
      decision.kind = DecisionKind::Updated;
      decision.id = RealId{existing->id};
    } else if (dry_run) {
      PendingId pending{next_pending++};
      decision.kind = DecisionKind::Created;
      decision.id = pending;
      log_.append(prefix + "DRY RUN: Would create new record (pending ID: " + to_string(*decision.id) + ").",
                  Severity::Info);
    } else {
      action = "creating new record";
      store::RecordId id = store_.create(request);
      decision.kind = DecisionKind::Created;
      decision.id = RealId{id};
      log_.append(prefix + "Successfully created new record (ID: " + std::to_string(id) + ").", Severity::Success);
    }
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Reconciler: Store rejected entry #" << index << ": " << e.what();
    decision.kind = DecisionKind::Skipped;
    decision.reason = SkipReason::StoreError;
    decision.detail = e.what();
    decision.id.reset();
    log_.append(prefix + "Error " + action + ": " + e.what(), Severity::Error);
    return decision;
  }

  if (!incoming.metadata.empty()) {
    apply_metadata(incoming, decision, dry_run, prefix);
  }
  return decision;
}

void Reconciler::apply_metadata(const record::Record& incoming, Decision& decision, bool dry_run,
                                const std::string& prefix) {
  log_.append(prefix + "Processing metadata for record ID " + to_string(*decision.id) + "...",
              Severity::InfoDetail);

  bool replaces_roles = incoming.metadata.count(options_.role_key) != 0;

  if (dry_run) {
    if (replaces_roles) {
      log_.append(prefix + "DRY RUN: Would clear existing roles before applying imported ones.",
                  Severity::InfoDetail);
    }
    for (const auto& entry : incoming.metadata) {
      decision.metadata_keys.push_back(entry.first);
      log_.append(prefix + "DRY RUN: Would update meta_key \"" + entry.first + "\".", Severity::InfoDetail);
    }
    return;
  }

  store::RecordId id = std::get<RealId>(*decision.id).value;

  if (replaces_roles) {
    try {
      store_.clear_roles(id);
      log_.append(prefix + "Cleared existing roles before applying imported ones.", Severity::InfoDetail);
    }
    catch (const store::StoreError& e) {
      ++decision.metadata_failures;
      log_.append(prefix + "Error clearing existing roles: " + e.what(), Severity::Error);
    }
  }

  for (const auto& [meta_key, meta_value] : incoming.metadata) {
    try {
      store_.set_metadata(id, meta_key, meta_value);
      decision.metadata_keys.push_back(meta_key);
    }
    catch (const store::StoreError& e) {
      ++decision.metadata_failures;
      log_.append(prefix + "Error updating meta_key \"" + meta_key + "\": " + e.what(), Severity::Error);
    }
  }
}

std::chrono::system_clock::time_point Reconciler::now() const {
  return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

} // namespace reconcile
} // namespace k7
