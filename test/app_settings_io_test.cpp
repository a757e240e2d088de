#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "harp/app_settings.hpp"
#include "harp/app_settings_io.hpp"

using namespace harp;

namespace {

std::string temp_path(const char* name) {
    return ::testing::TempDir() + name;
}

} // namespace

TEST(AppSettingsIoTest, Defaults) {
    AppSettings st;
    EXPECT_EQ(st.key_index, 4);
    EXPECT_EQ(st.tune_index, 6);
    EXPECT_EQ(st.concert_pitch_index, 9);
    EXPECT_EQ(st.algorithm_index, 0);
    EXPECT_EQ(st.confidence_index, 0);
    EXPECT_EQ(st.sample_rate, 44100);
    EXPECT_EQ(st.buffer_size, 4096);
    EXPECT_EQ(st.device_name, "default");
}

TEST(AppSettingsIoTest, SaveThenLoad) {
    const std::string path = temp_path("harpbend_settings_roundtrip.json");
    AppSettings st;
    st.key_index = 11;
    st.tune_index = 2;
    st.concert_pitch_index = 12;
    st.algorithm_index = 3;
    st.confidence_index = 5;
    st.sample_rate = 48000;
    st.buffer_size = 8192;
    st.device_name = "hw:1,0";
    st.realtime_priority = true;
    ASSERT_TRUE(save_settings(path.c_str(), st));

    AppSettings loaded;
    ASSERT_TRUE(load_settings(path.c_str(), loaded));
    EXPECT_EQ(loaded.key_index, 11);
    EXPECT_EQ(loaded.tune_index, 2);
    EXPECT_EQ(loaded.concert_pitch_index, 12);
    EXPECT_EQ(loaded.algorithm_index, 3);
    EXPECT_EQ(loaded.confidence_index, 5);
    EXPECT_EQ(loaded.sample_rate, 48000);
    EXPECT_EQ(loaded.buffer_size, 8192);
    EXPECT_EQ(loaded.device_name, "hw:1,0");
    EXPECT_TRUE(loaded.realtime_priority);
    std::remove(path.c_str());
}

TEST(AppSettingsIoTest, MissingKeysKeepDefaults) {
    const std::string path = temp_path("harpbend_settings_partial.json");
    {
        std::ofstream out(path);
        out << "{\n  \"tune_index\": 0\n}\n";
    }
    AppSettings st;
    ASSERT_TRUE(load_settings(path.c_str(), st));
    EXPECT_EQ(st.tune_index, 0);
    EXPECT_EQ(st.key_index, 4);
    EXPECT_EQ(st.device_name, "default");
    std::remove(path.c_str());
}

TEST(AppSettingsIoTest, NonPositiveSizesKeepCurrentValues) {
    const std::string path = temp_path("harpbend_settings_negative.json");
    {
        std::ofstream out(path);
        out << "{\n  \"sample_rate\": -44100,\n  \"buffer_size\": 0,\n  \"key_index\": 2\n}\n";
    }
    AppSettings st;
    ASSERT_TRUE(load_settings(path.c_str(), st));
    EXPECT_EQ(st.sample_rate, 44100);
    EXPECT_EQ(st.buffer_size, 4096);
    EXPECT_EQ(st.key_index, 2);
    std::remove(path.c_str());
}

TEST(AppSettingsIoTest, MissingFileFails) {
    AppSettings st;
    st.key_index = 1;
    EXPECT_FALSE(load_settings(temp_path("harpbend_does_not_exist.json").c_str(), st));
    EXPECT_EQ(st.key_index, 1);
}
