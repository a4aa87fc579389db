#ifndef SCRIBE_ENGINE_BACKEND_HPP
#define SCRIBE_ENGINE_BACKEND_HPP

#include <string>
#include <vector>

#include "../cancellation.hpp"
#include "../params.hpp"
#include "../scribe_types.hpp"
#include "../transcription_callback.hpp"

namespace scribe {

/// @brief Per-call options forwarded to the backend
struct TranscribeOptions {
    int n_processors = 0;                               // 0 = engine default
    const CancellationToken* cancel_token = nullptr;    // polled during inference
};

// =============================================================================
// Engine Backend Interface (引擎后端抽象接口)
// =============================================================================
//
// A backend wraps one speech-to-text engine. Steps to add one:
// 1. derive from IEngineBackend
// 2. implement the pure virtual functions
// 3. register it in EngineBackendFactory (backends/backend_factory.hpp)
//

class IEngineBackend {
public:
    virtual ~IEngineBackend() = default;

    // -------------------------------------------------------------------------
    // 生命周期管理
    // -------------------------------------------------------------------------

    /// @brief Load the model and remember the engine parameters
    /// @param model model file path or model name
    /// @param params resolved engine parameters
    virtual ErrorInfo initialize(const std::string& model, const ResolvedParams& params) = 0;

    virtual void shutdown() = 0;

    virtual bool isInitialized() const = 0;

    // -------------------------------------------------------------------------
    // 后端信息
    // -------------------------------------------------------------------------

    virtual BackendType getType() const = 0;

    /// @brief Name used in log lines
    virtual std::string getName() const = 0;

    /// @brief Engine build/system description
    virtual std::string systemInfo() const = 0;

    /// @brief Effective parameters, must contain "n_threads"
    virtual ResolvedParams getParams() const = 0;

    // -------------------------------------------------------------------------
    // 识别
    // -------------------------------------------------------------------------

    /// @brief Transcribe PCM audio
    /// @param audio mono float PCM at SAMPLE_RATE
    /// @param options processor hint and cancellation token
    /// @param segments [out] transcript segments
    /// @return CANCELLED if the token fired during inference
    virtual ErrorInfo transcribe(const AudioData& audio,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) = 0;

    /// @brief Decode and transcribe a media file
    virtual ErrorInfo transcribeFile(const std::string& file_path,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) = 0;

    /// @brief Print engine timing counters
    virtual void printTimings() {}

    // -------------------------------------------------------------------------
    // 回调设置
    // -------------------------------------------------------------------------

    /// @brief Callback for new segments (lifetime managed by the caller)
    virtual void setCallback(ITranscriptionCallback* callback) {
        callback_ = callback;
    }

protected:
    ITranscriptionCallback* callback_ = nullptr;

    void notifySegment(const Segment& segment) {
        if (callback_) callback_->onSegment(segment);
    }
};

}  // namespace scribe

#endif  // SCRIBE_ENGINE_BACKEND_HPP
