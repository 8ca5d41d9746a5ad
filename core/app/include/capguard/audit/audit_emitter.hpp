#pragma once

#include "capguard/eventbus/event_bus.hpp"
#include "capguard/events/event.hpp"
#include "capguard/time/time_utils.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// AuditEmitter: idempotent front door to the audit EventBus
// -----------------------------------------------------------------------------
//
// @brief  Publishes each audit event id at most once within the retention
//         window.
//
// @details
// Evaluations are replayed freely (sweeps, gateway polling, retries), and
// most audit ids are content-addressed, so the same logical event is often
// produced many times. The emitter remembers the ids it has published and
// drops repeats before they reach the bus.
//
// Retention: an id is kept while its occurred_at_ms is within retention_ms
// of the newest event seen, and forgotten on a later emit(). Ids embed their
// minute bucket, so a replay of the same logical event always falls inside
// the window.
//
// Subscriber failures are counted by the bus and logged here. They never
// propagate to the caller and never undo the state change being audited.
//
// Ownership:
//   Holds a non-owning reference to the bus, which must outlive it.
//
// Thread-safety:
//   emit() may be called from any thread. The seen-id set is guarded by a
//   mutex; the id is recorded before publishing so that two racing callers
//   cannot both publish it.
// -----------------------------------------------------------------------------
class AuditEmitter {
 public:
  static constexpr std::int64_t kDefaultRetentionMs = kMillisPerDay;

  explicit AuditEmitter(EventBus& bus,
                        std::int64_t retention_ms = kDefaultRetentionMs);

  AuditEmitter(const AuditEmitter&) = delete;
  AuditEmitter& operator=(const AuditEmitter&) = delete;

  // Returns true if the event was published, false if its id was seen before.
  bool emit(const Event& event);

  bool hasEmitted(const std::string& id) const;

  // Retained ids in publication order, oldest first.
  std::vector<std::string> emittedIds() const;

  // Retained ids whose event occurred at or after since_ms.
  std::vector<std::string> emittedIdsSince(std::int64_t since_ms) const;

  EventBus& bus() { return bus_; }

 private:
  // Caller holds mutex_.
  void pruneExpired();

  EventBus& bus_;
  const std::int64_t retention_ms_;
  mutable std::mutex mutex_;
  std::unordered_set<std::string> emitted_;
  std::deque<std::pair<std::int64_t, std::string>> order_;  // (occurred, id)
  std::int64_t newest_ms_{0};
  bool any_{false};
};

}  // namespace capguard
