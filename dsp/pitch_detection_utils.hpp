#pragma once

namespace harp::dsp {

// Vertex of the parabola through values[peak-1..peak+1], as a fractional index.
// Returns peak unchanged at the borders, for a flat neighbourhood, or when the
// offset would exceed one bin.
double parabolic_interpolation(const double* values, int size, int peak);

double compute_rms(const float* samples, int num_samples);

// False for null/short buffers, bad sample rates, non-finite or all-zero samples.
bool is_analyzable(const float* samples, int num_samples, int sample_rate);

} // namespace harp::dsp
