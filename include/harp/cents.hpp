#pragma once

namespace harp {

// Interval from f2 to f1 in cents: 1200*log2(f1/f2).
// Positive when f1 is above f2. Callers pass the measured frequency first
// and the reference second.
double get_cents(double f1, double f2);

// 2^(cents/1200) * frequency
double add_cents_to_frequency(double cents, double frequency);

// Floor-truncates to 3 decimals: floor(value*1000)/1000, where a value that
// is already a 3-decimal number is returned unchanged.
double round3(double value);

} // namespace harp
