#ifndef SCRIBE_TRANSCRIPTION_CALLBACK_HPP
#define SCRIBE_TRANSCRIPTION_CALLBACK_HPP

#include <functional>
#include <memory>
#include <utility>

#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// Transcription Callback Interface (回调接口)
// =============================================================================
//
// Two ways to receive events:
// 1. derive from ITranscriptionCallback and override what you need
// 2. build a LambdaCallback
//
// Callbacks run on the thread that called Engine::transcribe().
//

class ITranscriptionCallback {
public:
    virtual ~ITranscriptionCallback() = default;

    /// @brief A transcription call started
    virtual void onStart() {}

    /// @brief The engine produced a new segment
    /// @note Called while inference is still running
    virtual void onSegment(const Segment& segment) = 0;

    /// @brief The transcription call finished successfully
    virtual void onComplete() {}

    /// @brief The transcription call failed
    virtual void onError(const ErrorInfo& error) {
        (void)error;
    }
};

using OnStartCallback = std::function<void()>;
using OnSegmentCallback = std::function<void(const Segment&)>;
using OnCompleteCallback = std::function<void()>;
using OnErrorCallback = std::function<void(const ErrorInfo&)>;

// =============================================================================
// Lambda Callback Adapter (Lambda适配器)
// =============================================================================
//
//   auto callback = LambdaCallback::create()
//       .onSegment([](const Segment& s) {
//           std::cout << s.text << std::endl;
//       })
//       .build();
//
//   engine.setCallback(std::move(callback));
//

class LambdaCallback : public ITranscriptionCallback {
public:
    class Builder {
    public:
        Builder& onStart(OnStartCallback cb) { on_start_ = std::move(cb); return *this; }
        Builder& onSegment(OnSegmentCallback cb) { on_segment_ = std::move(cb); return *this; }
        Builder& onComplete(OnCompleteCallback cb) { on_complete_ = std::move(cb); return *this; }
        Builder& onError(OnErrorCallback cb) { on_error_ = std::move(cb); return *this; }

        std::unique_ptr<LambdaCallback> build() {
            auto cb = std::make_unique<LambdaCallback>();
            cb->on_start_ = std::move(on_start_);
            cb->on_segment_ = std::move(on_segment_);
            cb->on_complete_ = std::move(on_complete_);
            cb->on_error_ = std::move(on_error_);
            return cb;
        }

    private:
        OnStartCallback on_start_;
        OnSegmentCallback on_segment_;
        OnCompleteCallback on_complete_;
        OnErrorCallback on_error_;
    };

    static Builder create() { return Builder(); }

    void onStart() override { if (on_start_) on_start_(); }
    void onSegment(const Segment& segment) override { if (on_segment_) on_segment_(segment); }
    void onComplete() override { if (on_complete_) on_complete_(); }
    void onError(const ErrorInfo& error) override { if (on_error_) on_error_(error); }

private:
    OnStartCallback on_start_;
    OnSegmentCallback on_segment_;
    OnCompleteCallback on_complete_;
    OnErrorCallback on_error_;
};

}  // namespace scribe

#endif  // SCRIBE_TRANSCRIPTION_CALLBACK_HPP
