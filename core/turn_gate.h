#ifndef GENEFLOW_CORE_TURN_GATE_H_
#define GENEFLOW_CORE_TURN_GATE_H_

#include <cstdint>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace geneflow {

/**
 * @brief Serializes work per key in arrival order.
 *
 * Each Acquire() takes a ticket for its key and blocks until every earlier
 * ticket for that key has been released. Different keys never wait on each
 * other. Lanes are dropped once no ticket refers to them.
 */
class TurnGate {
 public:
  class Turn {
   public:
    Turn(Turn&& other) noexcept : gate_(other.gate_), key_(std::move(other.key_)) { other.gate_ = nullptr; }
    Turn(const Turn&) = delete;
    Turn& operator=(const Turn&) = delete;
    Turn& operator=(Turn&&) = delete;
    ~Turn();

   private:
    friend class TurnGate;
    Turn(TurnGate* gate, std::string key) : gate_(gate), key_(std::move(key)) {}

    TurnGate* gate_;
    std::string key_;
  };

  TurnGate() = default;
  TurnGate(const TurnGate&) = delete;
  TurnGate& operator=(const TurnGate&) = delete;

  Turn Acquire(const std::string& key);

  // Keys with at least one outstanding ticket.
  size_t ActiveLanes();

 private:
  struct Lane {
    uint64_t next_ticket = 0;
    uint64_t now_serving = 0;
  };

  void Release(const std::string& key);

  absl::Mutex mu_;
  absl::flat_hash_map<std::string, Lane> lanes_ ABSL_GUARDED_BY(mu_);
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_TURN_GATE_H_
