#ifndef SCRIBE_WHISPER_BACKEND_HPP
#define SCRIBE_WHISPER_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "../engine_backend.hpp"

// Opaque whisper.cpp handles, whisper.h stays out of the public headers
struct whisper_context;
struct whisper_state;
struct whisper_full_params;

namespace scribe {

// =============================================================================
// Whisper Backend (whisper.cpp 后端实现)
// =============================================================================
//
// 基于 whisper.cpp 的本地离线转写后端。
//
// 模型要求:
// - ggml-<name>.bin, resolved and downloaded by whisper::ModelLoader
// - 16 kHz mono input
//

class WhisperBackend : public IEngineBackend {
public:
    WhisperBackend();
    ~WhisperBackend() override;

    // -------------------------------------------------------------------------
    // IEngineBackend 接口实现
    // -------------------------------------------------------------------------

    ErrorInfo initialize(const std::string& model, const ResolvedParams& params) override;
    void shutdown() override;
    bool isInitialized() const override { return ctx_ != nullptr; }

    BackendType getType() const override { return BackendType::WHISPER; }
    std::string getName() const override { return "whisper.cpp"; }
    std::string systemInfo() const override;
    ResolvedParams getParams() const override;

    ErrorInfo transcribe(const AudioData& audio,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) override;

    ErrorInfo transcribeFile(const std::string& file_path,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) override;

    void printTimings() override;

    /// @brief Reject audio whisper cannot take as is
    /// @return UNSUPPORTED_FORMAT unless mono, UNSUPPORTED_SAMPLE_RATE unless SAMPLE_RATE
    static ErrorInfo checkAudio(const AudioData& audio);

    const std::string& getModelPath() const { return model_path_; }

private:
    struct ContextDeleter {
        void operator()(whisper_context* ctx) const;
    };

    std::unique_ptr<whisper_context, ContextDeleter> ctx_;
    std::string model_path_;
    ResolvedParams params_;

    // Storage for the const char* fields of whisper_full_params
    std::string language_;
    std::string initial_prompt_;

    // Token of the transcribe() call in progress, read by abortCallback
    const CancellationToken* cancel_token_ = nullptr;

    // Copy the resolved parameters into whisper_full_params
    void applyParams(whisper_full_params& wparams);

    static bool abortCallback(void* user_data);
    static void newSegmentCallback(whisper_context* ctx, whisper_state* state,
        int n_new, void* user_data);
};

}  // namespace scribe

#endif  // SCRIBE_WHISPER_BACKEND_HPP
