#pragma once

#include <deque>
#include <functional>
#include <vector>

namespace harp {

// Turns arbitrary-sized capture periods into overlapping analysis blocks:
// once block_size samples are buffered, the newest block_size samples are
// emitted every hop samples.
class BlockAccumulator {
public:
    using BlockCallback = std::function<void(const float* block, int block_size)>;

    BlockAccumulator(int block_size, int hop);

    // Returns the number of blocks emitted.
    int push(const float* input, int num_samples, const BlockCallback& callback);
    void reset();

    int block_size() const { return block_size_; }
    int hop() const { return hop_; }

private:
    int block_size_;
    int hop_;
    int since_emit_ = 0;
    std::deque<float> ring_;
    std::vector<float> block_;
};

} // namespace harp
