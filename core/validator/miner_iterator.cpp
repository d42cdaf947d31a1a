/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validator/miner_iterator.hpp"

#include <algorithm>
#include <stdexcept>

namespace vigil::validator {

  MinerIterator::MinerIterator(std::vector<Uid> miner_uids, size_t start_offset)
      : miner_uids_{std::move(miner_uids)}, index_{0} {
    if (miner_uids_.empty()) {
      throw std::logic_error{"MinerIterator needs at least one miner"};
    }
    std::sort(miner_uids_.begin(), miner_uids_.end());
    index_ = start_offset % miner_uids_.size();
  }

  Uid MinerIterator::peek() const {
    std::unique_lock lock{mutex_};
    return miner_uids_[index_];
  }

  Uid MinerIterator::next() {
    std::unique_lock lock{mutex_};
    auto uid = miner_uids_[index_];
    index_ = (index_ + 1) % miner_uids_.size();
    return uid;
  }

  void MinerIterator::setMinerUids(std::vector<Uid> miner_uids) {
    if (miner_uids.empty()) {
      throw std::logic_error{"MinerIterator needs at least one miner"};
    }
    std::sort(miner_uids.begin(), miner_uids.end());

    std::unique_lock lock{mutex_};
    auto current = miner_uids_[index_];
    miner_uids_ = std::move(miner_uids);
    auto it =
        std::lower_bound(miner_uids_.begin(), miner_uids_.end(), current);
    index_ = it == miner_uids_.end()
               ? 0
               : static_cast<size_t>(it - miner_uids_.begin());
  }

  std::vector<Uid> MinerIterator::minerUids() const {
    std::unique_lock lock{mutex_};
    return miner_uids_;
  }

}  // namespace vigil::validator
