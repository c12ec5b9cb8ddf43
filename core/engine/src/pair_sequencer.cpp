#include "stratexec/engine/pair_sequencer.hpp"

namespace stratexec {

PairSequencer::Token PairSequencer::acquire(const std::string& account_id,
                                            const std::string& strategy_id) {
  PairKey key{account_id, strategy_id};
  std::shared_ptr<Lane> lane;
  {
    std::lock_guard lock(mutex_);
    auto& slot = lanes_[key];
    if (!slot) {
      slot = std::make_shared<Lane>();
    }
    ++slot->users;
    lane = slot;
  }

  {
    std::unique_lock lock(lane->mutex);
    const std::uint64_t ticket = lane->next_ticket++;
    lane->cv.wait(lock, [&] { return lane->serving == ticket; });
  }
  return Token(this, std::move(key), std::move(lane));
}

std::size_t PairSequencer::activePairs() const {
  std::lock_guard lock(mutex_);
  return lanes_.size();
}

void PairSequencer::release(const PairKey& key,
                            const std::shared_ptr<Lane>& lane) noexcept {
  {
    std::lock_guard lock(lane->mutex);
    ++lane->serving;
  }
  lane->cv.notify_all();

  std::lock_guard lock(mutex_);
  if (--lane->users == 0) {
    auto it = lanes_.find(key);
    if (it != lanes_.end() && it->second == lane) {
      lanes_.erase(it);
    }
  }
}

void PairSequencer::Token::release() noexcept {
  if (sequencer_ != nullptr && lane_) {
    sequencer_->release(key_, lane_);
  }
  sequencer_ = nullptr;
  lane_.reset();
}

}  // namespace stratexec
