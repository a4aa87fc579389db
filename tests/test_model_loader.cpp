#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "scribe/backends/whisper/model_loader.hpp"

namespace fs = std::filesystem;

using scribe::ErrorCode;
using scribe::whisper::ModelLoader;

class ModelLoaderTest : public ::testing::Test {
protected:
    fs::path dir;
    ModelLoader::Config config;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("scribe_models_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        config.model_dir = dir.string();
        // Unroutable, a download attempt fails fast instead of fetching
        config.base_url = "http://127.0.0.1:9";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static void touch(const fs::path& path) {
        std::ofstream out(path);
        out << "ggml";
    }
};

TEST(ModelLoaderNamesTest, KnowsTheWhisperModels) {
    EXPECT_TRUE(ModelLoader::isKnownModel("tiny"));
    EXPECT_TRUE(ModelLoader::isKnownModel("base.en"));
    EXPECT_TRUE(ModelLoader::isKnownModel("large-v3-turbo"));
    EXPECT_FALSE(ModelLoader::isKnownModel("huge"));
    EXPECT_EQ(ModelLoader::availableModels().size(), 12u);
    EXPECT_EQ(ModelLoader::modelFileName("small.en"), "ggml-small.en.bin");
}

TEST(ModelLoaderNamesTest, BuildsDownloadUrl) {
    ModelLoader loader;
    EXPECT_EQ(loader.getModelUrl("tiny"),
        "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin");
}

TEST(ModelLoaderNamesTest, ExpandsHomeDirectory) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(ModelLoader::expandPath("~/models"), std::string(home) + "/models");
    EXPECT_EQ(ModelLoader::expandPath("/abs/path"), "/abs/path");
    EXPECT_EQ(ModelLoader::expandPath(""), "");
}

TEST_F(ModelLoaderTest, ExistingFileIsUsedAsIs) {
    const fs::path model = dir / "custom.bin";
    touch(model);

    ModelLoader loader(config);
    std::string path;
    ASSERT_TRUE(loader.resolve(model.string(), path).isOk());
    EXPECT_EQ(path, model.string());
}

TEST_F(ModelLoaderTest, DownloadedModelIsReused) {
    touch(dir / "ggml-base.en.bin");

    ModelLoader loader(config);
    EXPECT_TRUE(loader.isModelAvailable("base.en"));

    testing::internal::CaptureStdout();
    std::string path;
    auto err = loader.resolve("base.en", path);
    testing::internal::GetCapturedStdout();

    ASSERT_TRUE(err.isOk()) << err.describe();
    EXPECT_EQ(path, (dir / "ggml-base.en.bin").string());
}

TEST_F(ModelLoaderTest, UnknownNameIsRejected) {
    ModelLoader loader(config);
    std::string path = "untouched";

    auto err = loader.resolve("not-a-model", path);
    EXPECT_EQ(err.code, ErrorCode::MODEL_NOT_FOUND);
    EXPECT_TRUE(path.empty());
}

TEST_F(ModelLoaderTest, FailedDownloadLeavesNoFile) {
    ModelLoader loader(config);

    testing::internal::CaptureStdout();
    std::string path;
    auto err = loader.resolve("tiny", path);
    testing::internal::GetCapturedStdout();

    EXPECT_FALSE(err.isOk());
    EXPECT_TRUE(path.empty());
    EXPECT_FALSE(fs::exists(dir / "ggml-tiny.bin"));
    EXPECT_FALSE(fs::exists(dir / "ggml-tiny.bin.part"));
}

TEST(ModelLoaderProgressTest, PrintsEachPercentOnce) {
    std::ostringstream out;
    auto progress = ModelLoader::consoleProgress(out);

    progress(0.0);
    progress(0.004);
    progress(0.42);
    progress(0.421);
    progress(1.0);

    EXPECT_EQ(out.str(),
        "\r[ModelLoader] Downloading ... 0%"
        "\r[ModelLoader] Downloading ... 42%"
        "\r[ModelLoader] Downloading ... 100%\n");
}

TEST(ModelLoaderProgressTest, IgnoresProgressGoingBackwards) {
    std::ostringstream out;
    auto progress = ModelLoader::consoleProgress(out);

    progress(0.5);
    progress(0.3);

    EXPECT_EQ(out.str(), "\r[ModelLoader] Downloading ... 50%");
}
