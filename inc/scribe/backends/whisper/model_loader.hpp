/**
 * @file model_loader.hpp
 * @brief Model resolution and downloading for whisper.cpp
 *
 * Turns the --model argument into a ggml model file on disk, downloading
 * known models from the whisper.cpp model repository when missing.
 */

#ifndef SCRIBE_WHISPER_MODEL_LOADER_HPP
#define SCRIBE_WHISPER_MODEL_LOADER_HPP

#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "../../scribe_types.hpp"

namespace scribe {
namespace whisper {

/**
 * @class ModelLoader
 * @brief Manages ggml model files
 *
 * Provides:
 * - Model name to file name mapping
 * - Automatic model downloading
 * - Path expansion (~ to home directory)
 */
class ModelLoader {
public:
    /**
     * @brief Download progress callback
     * @param progress Download progress [0.0, 1.0]
     */
    using ProgressCallback = std::function<void(double progress)>;

    struct Config {
        std::string model_dir = "~/.cache/scribe/models";
        std::string base_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
    };

    ModelLoader();
    explicit ModelLoader(const Config& config);
    ~ModelLoader();

    /**
     * @brief Resolve a model argument to a local file
     * @param model existing file path or a known model name
     * @param model_path [out] path of the ggml file
     * @param progress_cb Optional download progress callback
     * @return MODEL_NOT_FOUND for unknown names, DOWNLOAD_FAILED/NETWORK_ERROR
     *         when the download does not complete
     */
    ErrorInfo resolve(const std::string& model, std::string& model_path,
        ProgressCallback progress_cb = nullptr);

    /**
     * @brief Full path a model name is stored under
     * @param name model name ("base.en")
     */
    std::string getModelPath(const std::string& name) const;

    /**
     * @brief Check if a named model is already downloaded
     */
    bool isModelAvailable(const std::string& name) const;

    std::string getModelDir() const { return model_dir_expanded_; }

    /**
     * @brief Download URL of a named model
     */
    std::string getModelUrl(const std::string& name) const;

    /**
     * @brief Expand path (replace ~ with home directory)
     */
    static std::string expandPath(const std::string& path);

    /// @brief "ggml-<name>.bin"
    static std::string modelFileName(const std::string& name);

    static bool isKnownModel(const std::string& name);

    static const std::vector<std::string>& availableModels();

    /**
     * @brief Progress callback printing whole percent steps on one line
     * @param out stream to print to, must outlive the callback
     */
    static ProgressCallback consoleProgress(std::ostream& out = std::cout);

private:
    Config config_;
    std::string model_dir_expanded_;

    ErrorInfo createDirectory();
    ErrorInfo downloadFile(const std::string& url,
        const std::string& output_path,
        ProgressCallback progress_cb);
    static bool fileExists(const std::string& path);
};

}  // namespace whisper
}  // namespace scribe

#endif  // SCRIBE_WHISPER_MODEL_LOADER_HPP
