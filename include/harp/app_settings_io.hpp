#pragma once

#include "app_settings.hpp"

namespace harp {

// Keys missing from the file keep their current values in st, and so do
// non-positive sample_rate or buffer_size values.
bool load_settings(const char* path, AppSettings& st);
bool save_settings(const char* path, const AppSettings& st);

}
