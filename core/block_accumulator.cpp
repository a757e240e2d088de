#include "harp/block_accumulator.hpp"

#include <algorithm>

namespace harp {

BlockAccumulator::BlockAccumulator(int block_size, int hop)
    : block_size_(std::max(1, block_size)),
      hop_(hop > 0 ? std::min(hop, block_size_) : block_size_),
      block_(block_size_) {}

int BlockAccumulator::push(const float* input, int num_samples, const BlockCallback& callback) {
    if (!input || num_samples <= 0) return 0;
    int emitted = 0;
    for (int i = 0; i < num_samples; ++i) {
        ring_.push_back(input[i]);
        if (static_cast<int>(ring_.size()) > block_size_) ring_.pop_front();
        ++since_emit_;
        if (static_cast<int>(ring_.size()) == block_size_ && since_emit_ >= hop_) {
            since_emit_ = 0;
            std::copy(ring_.begin(), ring_.end(), block_.begin());
            if (callback) callback(block_.data(), block_size_);
            ++emitted;
        }
    }
    return emitted;
}

void BlockAccumulator::reset() {
    ring_.clear();
    since_emit_ = 0;
}

} // namespace harp
