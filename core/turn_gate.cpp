#include "core/turn_gate.h"

namespace geneflow {

TurnGate::Turn::~Turn() {
  if (gate_ != nullptr) gate_->Release(key_);
}

TurnGate::Turn TurnGate::Acquire(const std::string& key) {
  absl::MutexLock lock(&mu_);
  const uint64_t ticket = lanes_[key].next_ticket++;
  // flat_hash_map may rehash while we wait, so look the lane up on every check.
  auto my_turn = [this, &key, ticket]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    return lanes_[key].now_serving == ticket;
  };
  mu_.Await(absl::Condition(&my_turn));
  return Turn(this, key);
}

void TurnGate::Release(const std::string& key) {
  absl::MutexLock lock(&mu_);
  auto it = lanes_.find(key);
  if (it == lanes_.end()) return;
  Lane& lane = it->second;
  ++lane.now_serving;
  if (lane.now_serving == lane.next_ticket) lanes_.erase(it);
}

size_t TurnGate::ActiveLanes() {
  absl::MutexLock lock(&mu_);
  return lanes_.size();
}

}  // namespace geneflow
