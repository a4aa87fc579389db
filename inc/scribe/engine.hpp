#ifndef SCRIBE_ENGINE_HPP
#define SCRIBE_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "backends/engine_backend.hpp"
#include "params.hpp"
#include "scribe_types.hpp"
#include "transcription_callback.hpp"

namespace scribe {

// =============================================================================
// Engine (转写引擎 - 用户主接口)
// =============================================================================
//
// Owns one backend and adds lifecycle checks and callback dispatch.
//
//   scribe::Engine engine(scribe::EngineBackendFactory::create(scribe::BackendType::WHISPER));
//   auto err = engine.initialize("base.en", params);
//   if (!err.isOk()) {
//       std::cerr << "Init failed: " << err.message << std::endl;
//       return 1;
//   }
//
//   std::vector<scribe::Segment> segments;
//   err = engine.transcribe("audio.wav", {}, segments);
//

class Engine {
public:
    explicit Engine(std::unique_ptr<IEngineBackend> backend);
    ~Engine();

    // 禁止拷贝
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // -------------------------------------------------------------------------
    // 初始化与释放
    // -------------------------------------------------------------------------

    /// @brief Load the model
    /// @param model model file path or model name
    /// @param params resolved engine parameters
    ErrorInfo initialize(const std::string& model, const ResolvedParams& params);

    void shutdown();

    bool isInitialized() const { return initialized_; }

    // -------------------------------------------------------------------------
    // 回调设置
    // -------------------------------------------------------------------------

    /// @brief Engine owns the callback
    void setCallback(std::unique_ptr<ITranscriptionCallback> callback);

    /// @brief Caller owns the callback
    void setCallback(ITranscriptionCallback* callback);

    // -------------------------------------------------------------------------
    // 识别
    // -------------------------------------------------------------------------

    /// @brief Transcribe a media file
    /// @param media_file path to the audio file
    /// @param options processor hint and cancellation token
    /// @param segments [out] cleared, then filled on success
    /// @note Exceptions thrown by the backend propagate to the caller
    ErrorInfo transcribe(const std::string& media_file,
        const TranscribeOptions& options,
        std::vector<Segment>& segments);

    /// @brief Transcribe an in-memory buffer
    ErrorInfo transcribe(const AudioData& audio,
        const TranscribeOptions& options,
        std::vector<Segment>& segments);

    // -------------------------------------------------------------------------
    // 状态与调试
    // -------------------------------------------------------------------------

    void printTimings();

    std::string systemInfo() const;

    /// @brief Effective engine parameters, contains "n_threads"
    ResolvedParams getParams() const;

    const std::string& getModel() const { return model_; }

    std::string getBackendName() const;

    ErrorInfo getLastError() const { return last_error_; }

private:
    std::unique_ptr<IEngineBackend> backend_;
    std::unique_ptr<ITranscriptionCallback> owned_callback_;
    ITranscriptionCallback* callback_ = nullptr;

    std::string model_;
    bool initialized_ = false;

    ErrorInfo last_error_;

    ErrorInfo checkReady(const TranscribeOptions& options);
    ErrorInfo finish(ErrorInfo err);
};

}  // namespace scribe

#endif  // SCRIBE_ENGINE_HPP
