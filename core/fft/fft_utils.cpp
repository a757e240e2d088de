#include "harp/fft/fft_utils.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_map>

namespace harp::fft {

using Stages = std::vector<std::vector<std::complex<double>>>;

// Tables are never erased, so references stay valid after the lock is released.
static std::mutex g_cache_mutex;
static std::unordered_map<int, std::vector<int>> g_bitrev;
static std::unordered_map<int, Stages> g_twiddles;

static const std::vector<int>& get_or_build_bitrev(int n) {
    auto it = g_bitrev.find(n);
    if (it != g_bitrev.end()) return it->second;
    int bits = 0; while ((1 << bits) < n) ++bits;
    std::vector<int> br(n);
    for (int i = 0; i < n; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        br[i] = static_cast<int>(r);
    }
    auto [ins, _] = g_bitrev.emplace(n, std::move(br));
    return ins->second;
}

static const Stages& get_or_build_twiddles(int n) {
    auto it = g_twiddles.find(n);
    if (it != g_twiddles.end()) return it->second;
    const double two_pi = 6.28318530717958647692;
    Stages stages;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<double>> stage(half);
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * k / static_cast<double>(len);
            stage[k] = std::complex<double>(std::cos(angle), std::sin(angle));
        }
        stages.push_back(std::move(stage));
    }
    auto [ins, _] = g_twiddles.emplace(n, std::move(stages));
    return ins->second;
}

int next_power_of_two(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

void compute_fft_inplace(std::vector<std::complex<double>>& data) {
    const int n = static_cast<int>(data.size());
    if (n <= 1) return;

    const std::vector<int>* br = nullptr;
    const Stages* stages = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_cache_mutex);
        br = &get_or_build_bitrev(n);
        stages = &get_or_build_twiddles(n);
    }

    // Bit-reversal (swap pairs once)
    for (int i = 0; i < n; ++i) {
        const int j = (*br)[i];
        if (j > i) std::swap(data[i], data[j]);
    }

    // Iterative radix-2
    int stageIndex = 0;
    for (int len = 2; len <= n; len <<= 1, ++stageIndex) {
        const auto& W = (*stages)[stageIndex];
        const int half = len / 2;
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

void magnitude_spectrum(const float* samples, int num_samples, int fft_size,
                        std::vector<std::complex<double>>& work,
                        std::vector<double>& magnitudes) {
    work.assign(fft_size, std::complex<double>(0.0, 0.0));
    const int n = std::min(num_samples, fft_size);
    for (int i = 0; i < n; ++i) work[i] = std::complex<double>(samples[i], 0.0);
    compute_fft_inplace(work);
    const int half = fft_size / 2;
    magnitudes.resize(half);
    for (int k = 0; k < half; ++k) magnitudes[k] = std::abs(work[k]);
}

} // namespace harp::fft
