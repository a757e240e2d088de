#pragma once

#include <complex>
#include <vector>

namespace harp::fft {

// Smallest power of two >= n (1 for n <= 1).
int next_power_of_two(int n);

// In-place iterative radix-2 FFT using cached bit-reversal and twiddles.
// Size must be a power of two. Safe to call from several threads.
void compute_fft_inplace(std::vector<std::complex<double>>& data);

// Zero-pads samples to fft_size, transforms, and writes |X[k]| for
// k in [0, fft_size/2) to magnitudes. work is scratch space reused across calls.
void magnitude_spectrum(const float* samples, int num_samples, int fft_size,
                        std::vector<std::complex<double>>& work,
                        std::vector<double>& magnitudes);

} // namespace harp::fft
