#include "scribe/recording.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "scribe/audio/audio_loader.hpp"
#include "scribe/backends/backend_factory.hpp"

namespace scribe {

Recording::Recording(int duration_s, const std::string& model, const ArgumentSet& engine_args)
    : duration_s_(duration_s)
    , model_(model)
    , params_(ParamResolver::resolve(engine_args))
{
    params_.set("print_realtime", ParamValue(true));
}

ErrorInfo Recording::start(std::vector<Segment>* segments) {
    if (!engine_) {
        auto backend = EngineBackendFactory::create(BackendType::WHISPER);
        if (!backend) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "whisper backend not available");
        }
        auto engine = std::make_unique<Engine>(std::move(backend));
        auto err = engine->initialize(model_, params_);
        if (!err.isOk()) {
            return err;
        }
        engine_ = std::move(engine);
    }

    std::cout << "[Recording] Start recording for " << duration_s_ << "s ..." << std::endl;

    AudioData audio;
    auto err = recorder_.record(duration_s_, audio, cancel_token_);
    if (!err.isOk()) {
        return err;
    }
    std::cout << "[Recording] Duration finished" << std::endl;

    if (audio.channels > 1) {
        audio.samples = AudioLoader::downmix(audio.samples, audio.channels);
        audio.channels = 1;
    }

    TranscribeOptions options;
    options.cancel_token = cancel_token_;

    std::vector<Segment> result;
    err = engine_->transcribe(audio, options, result);
    if (!err.isOk()) {
        return err;
    }

    engine_->printTimings();

    if (segments) {
        *segments = std::move(result);
    }
    return ErrorInfo::ok();
}

}  // namespace scribe
