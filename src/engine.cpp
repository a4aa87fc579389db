#include "scribe/engine.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scribe {

// =============================================================================
// Engine Implementation
// =============================================================================

Engine::Engine(std::unique_ptr<IEngineBackend> backend)
    : backend_(std::move(backend))
{
}

Engine::~Engine() {
    shutdown();
}

ErrorInfo Engine::initialize(const std::string& model, const ResolvedParams& params) {
    if (initialized_) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Engine already initialized");
    }

    if (!backend_) {
        last_error_ = ErrorInfo::error(ErrorCode::INVALID_CONFIG, "No backend available");
        return last_error_;
    }

    auto err = backend_->initialize(model, params);
    if (!err.isOk()) {
        last_error_ = err;
        return err;
    }

    if (callback_) {
        backend_->setCallback(callback_);
    }

    model_ = model;
    initialized_ = true;
    std::cout << "[Engine] Initialized with backend: " << backend_->getName() << std::endl;

    return ErrorInfo::ok();
}

void Engine::shutdown() {
    if (backend_ && initialized_) {
        backend_->shutdown();
    }
    initialized_ = false;
}

void Engine::setCallback(std::unique_ptr<ITranscriptionCallback> callback) {
    owned_callback_ = std::move(callback);
    callback_ = owned_callback_.get();
    if (backend_) {
        backend_->setCallback(callback_);
    }
}

void Engine::setCallback(ITranscriptionCallback* callback) {
    owned_callback_.reset();
    callback_ = callback;
    if (backend_) {
        backend_->setCallback(callback_);
    }
}

// =============================================================================
// Transcription
// =============================================================================

ErrorInfo Engine::checkReady(const TranscribeOptions& options) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Engine not initialized");
    }
    if (options.cancel_token && options.cancel_token->isCancelled()) {
        return ErrorInfo::error(ErrorCode::CANCELLED, "Transcription cancelled");
    }
    return ErrorInfo::ok();
}

ErrorInfo Engine::finish(ErrorInfo err) {
    if (!err.isOk()) {
        last_error_ = err;
        if (callback_) {
            callback_->onError(err);
        }
        return err;
    }

    if (callback_) {
        callback_->onComplete();
    }
    return err;
}

ErrorInfo Engine::transcribe(const std::string& media_file,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) {
    segments.clear();

    auto err = checkReady(options);
    if (!err.isOk()) {
        last_error_ = err;
        return err;
    }

    if (callback_) {
        callback_->onStart();
    }

    err = backend_->transcribeFile(media_file, options, segments);

    if (!err.isOk()) {
        segments.clear();
    }

    return finish(err);
}

ErrorInfo Engine::transcribe(const AudioData& audio,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) {
    segments.clear();

    auto err = checkReady(options);
    if (!err.isOk()) {
        last_error_ = err;
        return err;
    }

    if (callback_) {
        callback_->onStart();
    }

    err = backend_->transcribe(audio, options, segments);

    if (!err.isOk()) {
        segments.clear();
    }

    return finish(err);
}

// =============================================================================
// Status & Info
// =============================================================================

void Engine::printTimings() {
    if (backend_ && initialized_) {
        backend_->printTimings();
    }
}

std::string Engine::systemInfo() const {
    if (!backend_) {
        return "";
    }
    return backend_->systemInfo();
}

ResolvedParams Engine::getParams() const {
    if (!backend_) {
        return {};
    }
    return backend_->getParams();
}

std::string Engine::getBackendName() const {
    return backend_ ? backend_->getName() : std::string("none");
}

}  // namespace scribe
