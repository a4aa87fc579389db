/**
 * @file model_loader.cpp
 * @brief Model resolution and downloading implementation
 */

#include "scribe/backends/whisper/model_loader.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace scribe {
namespace whisper {

ModelLoader::ModelLoader()
    : config_(Config{})
{
    model_dir_expanded_ = expandPath(config_.model_dir);
}

ModelLoader::ModelLoader(const Config& config)
    : config_(config)
{
    model_dir_expanded_ = expandPath(config_.model_dir);
}

ModelLoader::~ModelLoader() = default;

std::string ModelLoader::expandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");  // Windows
    }

    return home ? (std::string(home) + path.substr(1)) : path;
}

const std::vector<std::string>& ModelLoader::availableModels() {
    static const std::vector<std::string> models = {
        "tiny", "tiny.en",
        "base", "base.en",
        "small", "small.en",
        "medium", "medium.en",
        "large-v1", "large-v2", "large-v3", "large-v3-turbo",
    };
    return models;
}

bool ModelLoader::isKnownModel(const std::string& name) {
    const auto& models = availableModels();
    return std::find(models.begin(), models.end(), name) != models.end();
}

std::string ModelLoader::modelFileName(const std::string& name) {
    return "ggml-" + name + ".bin";
}

std::string ModelLoader::getModelPath(const std::string& name) const {
    return model_dir_expanded_ + "/" + modelFileName(name);
}

std::string ModelLoader::getModelUrl(const std::string& name) const {
    return config_.base_url + "/" + modelFileName(name);
}

bool ModelLoader::isModelAvailable(const std::string& name) const {
    return fileExists(getModelPath(name));
}

ErrorInfo ModelLoader::resolve(const std::string& model, std::string& model_path,
        ProgressCallback progress_cb) {
    model_path.clear();

    // A path to an existing file wins over a model name
    const std::string expanded = expandPath(model);
    if (fileExists(expanded)) {
        model_path = expanded;
        return ErrorInfo::ok();
    }

    if (!isKnownModel(model)) {
        std::string names;
        for (const auto& m : availableModels()) {
            names += (names.empty() ? "" : ", ") + m;
        }
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Model not found: " + model,
            "not a file and not one of: " + names);
    }

    const std::string path = getModelPath(model);
    if (fileExists(path)) {
        std::cout << "[ModelLoader] Model " << model << " already exists in "
                  << model_dir_expanded_ << std::endl;
        model_path = path;
        return ErrorInfo::ok();
    }

    auto err = createDirectory();
    if (!err.isOk()) {
        return err;
    }

    std::cout << "[ModelLoader] Downloading model " << model << " ..." << std::endl;
    err = downloadFile(getModelUrl(model), path, progress_cb);
    if (!err.isOk()) {
        return err;
    }

    model_path = path;
    return ErrorInfo::ok();
}

ErrorInfo ModelLoader::createDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(model_dir_expanded_, ec);
    if (ec) {
        return ErrorInfo::error(ErrorCode::IO_ERROR,
            "Failed to create directory: " + model_dir_expanded_, ec.message());
    }
    return ErrorInfo::ok();
}

bool ModelLoader::fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

ModelLoader::ProgressCallback ModelLoader::consoleProgress(std::ostream& out) {
    std::ostream* os = &out;
    auto last_percent = std::make_shared<int>(-1);
    return [os, last_percent](double progress) {
        int percent = static_cast<int>(progress * 100.0);
        if (percent > 100) percent = 100;
        if (percent <= *last_percent) {
            return;
        }
        *last_percent = percent;
        *os << "\r[ModelLoader] Downloading ... " << percent << "%";
        if (percent == 100) {
            *os << std::endl;
        } else {
            os->flush();
        }
    };
}

// CURL callback for writing data
static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::ofstream* file = static_cast<std::ofstream*>(userp);
    size_t total_size = size * nmemb;
    file->write(static_cast<const char*>(contents), total_size);
    return file->good() ? total_size : 0;
}

// CURL progress callback wrapper
struct ProgressData {
    ModelLoader::ProgressCallback cb;
};

static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                            curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* data = static_cast<ProgressData*>(clientp);
    if (data->cb && dltotal > 0) {
        data->cb(static_cast<double>(dlnow) / static_cast<double>(dltotal));
    }
    return 0;
}

ErrorInfo ModelLoader::downloadFile(const std::string& url,
                                    const std::string& output_path,
                                    ProgressCallback progress_cb) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR, "Failed to init curl");
    }

    // Download next to the target, renamed once complete
    const std::string part_path = output_path + ".part";

    std::ofstream file(part_path, std::ios::binary);
    if (!file.is_open()) {
        curl_easy_cleanup(curl);
        return ErrorInfo::error(ErrorCode::IO_ERROR, "Cannot open: " + part_path);
    }

    ProgressData progress_data{progress_cb};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "scribe/1.0");

    if (progress_cb) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_data);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);

    long response_code = 0;  // NOLINT(runtime/int)
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    curl_easy_cleanup(curl);
    file.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        std::filesystem::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR,
            "Download failed: " + url, curl_easy_strerror(res));
    }

    if (response_code != 200) {
        std::filesystem::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::DOWNLOAD_FAILED,
            "HTTP error " + std::to_string(response_code), url);
    }

    std::filesystem::rename(part_path, output_path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::IO_ERROR,
            "Cannot move downloaded model to " + output_path, reason);
    }

    std::cout << "[ModelLoader] Downloaded: " << output_path << std::endl;
    return ErrorInfo::ok();
}

}  // namespace whisper
}  // namespace scribe
