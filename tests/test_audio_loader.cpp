#include <gtest/gtest.h>

#include <sndfile.h>

#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "scribe/audio/audio_loader.hpp"

namespace fs = std::filesystem;

using scribe::AudioData;
using scribe::AudioLoader;
using scribe::ErrorCode;

class AudioLoaderTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("scribe_audio_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // Float WAV so samples survive the round trip exactly
    std::string writeWav(const std::string& name, int sample_rate, int channels,
            const std::vector<float>& interleaved) {
        const std::string path = (dir / name).string();

        SF_INFO info;
        memset(&info, 0, sizeof(info));
        info.samplerate = sample_rate;
        info.channels = channels;
        info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

        SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
        EXPECT_NE(file, nullptr) << sf_strerror(nullptr);
        if (file) {
            sf_write_float(file, interleaved.data(), static_cast<sf_count_t>(interleaved.size()));
            sf_close(file);
        }
        return path;
    }
};

TEST(AudioDownmixTest, AveragesChannels) {
    std::vector<float> stereo = {0.5f, -0.5f, 1.0f, 0.0f};
    std::vector<float> mono = AudioLoader::downmix(stereo, 2);

    ASSERT_EQ(mono.size(), 2u);
    EXPECT_FLOAT_EQ(mono[0], 0.0f);
    EXPECT_FLOAT_EQ(mono[1], 0.5f);
    EXPECT_EQ(AudioLoader::downmix(stereo, 1), stereo);
}

TEST_F(AudioLoaderTest, LoadsStereoAsMono) {
    std::vector<float> stereo;
    for (int i = 0; i < scribe::SAMPLE_RATE; ++i) {
        stereo.push_back(0.25f);
        stereo.push_back(0.75f);
    }
    const std::string path = writeWav("stereo.wav", scribe::SAMPLE_RATE, 2, stereo);

    AudioData audio;
    auto err = AudioLoader::load(path, audio);
    ASSERT_TRUE(err.isOk()) << err.describe();

    EXPECT_EQ(audio.channels, 1);
    EXPECT_EQ(audio.sample_rate, scribe::SAMPLE_RATE);
    ASSERT_EQ(audio.samples.size(), static_cast<size_t>(scribe::SAMPLE_RATE));
    EXPECT_FLOAT_EQ(audio.samples.front(), 0.5f);
    EXPECT_EQ(audio.durationMs(), 1000);
}

TEST_F(AudioLoaderTest, RejectsOtherSampleRates) {
    const std::string path = writeWav("cd.wav", 44100, 1, std::vector<float>(4410, 0.1f));

    AudioData audio;
    EXPECT_EQ(AudioLoader::load(path, audio).code, ErrorCode::UNSUPPORTED_SAMPLE_RATE);
    EXPECT_TRUE(AudioLoader::load(path, audio, 0).isOk());
    EXPECT_EQ(audio.sample_rate, 44100);
}

TEST_F(AudioLoaderTest, MissingFileIsReported) {
    AudioData audio;
    auto err = AudioLoader::load((dir / "nope.wav").string(), audio);
    EXPECT_EQ(err.code, ErrorCode::UNSUPPORTED_FORMAT);
}
