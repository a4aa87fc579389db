#include "scribe/backends/whisper/whisper_backend.hpp"

#include <whisper.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "scribe/audio/audio_loader.hpp"
#include "scribe/backends/whisper/model_loader.hpp"

namespace scribe {

namespace {

using Setter = std::function<void(whisper_full_params&, const ParamValue&)>;

Setter boolField(bool whisper_full_params::*field) {
    return [field](whisper_full_params& p, const ParamValue& v) { p.*field = paramAsBool(v); };
}

Setter intField(int whisper_full_params::*field) {
    return [field](whisper_full_params& p, const ParamValue& v) { p.*field = paramAsInt(v); };
}

Setter floatField(float whisper_full_params::*field) {
    return [field](whisper_full_params& p, const ParamValue& v) { p.*field = paramAsFloat(v); };
}

// Plain schema entries -> whisper_full_params fields. String fields are
// handled by the backend because they need storage that outlives the call.
const std::map<std::string, Setter>& setterTable() {
    static const std::map<std::string, Setter> table = {
        {"n_threads", intField(&whisper_full_params::n_threads)},
        {"n_max_text_ctx", intField(&whisper_full_params::n_max_text_ctx)},
        {"offset_ms", intField(&whisper_full_params::offset_ms)},
        {"duration_ms", intField(&whisper_full_params::duration_ms)},
        {"translate", boolField(&whisper_full_params::translate)},
        {"no_context", boolField(&whisper_full_params::no_context)},
        {"no_timestamps", boolField(&whisper_full_params::no_timestamps)},
        {"single_segment", boolField(&whisper_full_params::single_segment)},
        {"print_special", boolField(&whisper_full_params::print_special)},
        {"print_progress", boolField(&whisper_full_params::print_progress)},
        {"print_realtime", boolField(&whisper_full_params::print_realtime)},
        {"print_timestamps", boolField(&whisper_full_params::print_timestamps)},
        {"token_timestamps", boolField(&whisper_full_params::token_timestamps)},
        {"thold_pt", floatField(&whisper_full_params::thold_pt)},
        {"thold_ptsum", floatField(&whisper_full_params::thold_ptsum)},
        {"max_len", intField(&whisper_full_params::max_len)},
        {"split_on_word", boolField(&whisper_full_params::split_on_word)},
        {"max_tokens", intField(&whisper_full_params::max_tokens)},
        {"debug_mode", boolField(&whisper_full_params::debug_mode)},
        {"audio_ctx", intField(&whisper_full_params::audio_ctx)},
        {"tdrz_enable", boolField(&whisper_full_params::tdrz_enable)},
        {"detect_language", boolField(&whisper_full_params::detect_language)},
        {"suppress_blank", boolField(&whisper_full_params::suppress_blank)},
        {"temperature", floatField(&whisper_full_params::temperature)},
        {"max_initial_ts", floatField(&whisper_full_params::max_initial_ts)},
        {"length_penalty", floatField(&whisper_full_params::length_penalty)},
        {"temperature_inc", floatField(&whisper_full_params::temperature_inc)},
        {"entropy_thold", floatField(&whisper_full_params::entropy_thold)},
        {"logprob_thold", floatField(&whisper_full_params::logprob_thold)},
        {"no_speech_thold", floatField(&whisper_full_params::no_speech_thold)},
    };
    return table;
}

const char* const kStringParams[] = {"language", "initial_prompt"};

bool isStringParam(const std::string& name) {
    for (const char* known : kStringParams) {
        if (name == known) return true;
    }
    return false;
}

int groupInt(const ResolvedParams& params, const char* group, const char* field) {
    const ParamValue* v = params.find(group, field);
    return v ? paramAsInt(*v) : -1;
}

float groupFloat(const ResolvedParams& params, const char* group, const char* field) {
    const ParamValue* v = params.find(group, field);
    return v ? paramAsFloat(*v) : -1.0f;
}

// whisper reports segment times in 10 ms units
int64_t toMs(int64_t t) {
    return t * 10;
}

}  // namespace

// =============================================================================
// WhisperBackend Implementation
// =============================================================================

void WhisperBackend::ContextDeleter::operator()(whisper_context* ctx) const {
    if (ctx) {
        whisper_free(ctx);
    }
}

WhisperBackend::WhisperBackend() = default;

WhisperBackend::~WhisperBackend() {
    shutdown();
}

ErrorInfo WhisperBackend::initialize(const std::string& model, const ResolvedParams& params) {
    if (ctx_) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Backend already initialized");
    }

    whisper::ModelLoader loader;
    std::string model_path;
    auto err = loader.resolve(model, model_path, whisper::ModelLoader::consoleProgress());
    if (!err.isOk()) {
        return err;
    }

    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Failed to load whisper model", model_path);
    }
    ctx_.reset(ctx);
    model_path_ = model_path;

    params_ = ResolvedParams();
    for (const auto& kv : params.values) {
        if (!setterTable().count(kv.first) && !isStringParam(kv.first)) {
            std::cerr << "[Whisper] Ignoring unknown parameter: " << kv.first << std::endl;
            continue;
        }
        params_.set(kv.first, kv.second);
    }
    for (const auto& group : params.groups) {
        for (const auto& field : group.second) {
            const std::string path = group.first + "." + field.first;
            if (path != "greedy.best_of" && path != "beam_search.beam_size"
                    && path != "beam_search.patience") {
                std::cerr << "[Whisper] Ignoring unknown parameter: " << path << std::endl;
                continue;
            }
            params_.set(group.first, field.first, field.second);
        }
    }

    std::cout << "[Whisper] Model loaded: " << model_path_ << std::endl;
    return ErrorInfo::ok();
}

void WhisperBackend::shutdown() {
    ctx_.reset();
}

std::string WhisperBackend::systemInfo() const {
    const char* info = whisper_print_system_info();
    return info ? info : "";
}

ResolvedParams WhisperBackend::getParams() const {
    ResolvedParams effective = params_;

    // Report the engine's own thread count when none was requested
    if (!effective.find("n_threads")) {
        whisper_full_params defaults = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        effective.set("n_threads", ParamValue(static_cast<int32_t>(defaults.n_threads)));
    }
    return effective;
}

void WhisperBackend::applyParams(whisper_full_params& wparams) {
    for (const auto& kv : params_.values) {
        auto it = setterTable().find(kv.first);
        if (it != setterTable().end()) {
            it->second(wparams, kv.second);
        }
    }

    // "" and "auto" leave the language to whisper's detection
    language_.clear();
    if (const ParamValue* v = params_.find("language")) {
        language_ = paramAsString(*v);
    }
    wparams.language = language_.empty() ? "auto" : language_.c_str();

    initial_prompt_.clear();
    if (const ParamValue* v = params_.find("initial_prompt")) {
        initial_prompt_ = paramAsString(*v);
    }
    wparams.initial_prompt = initial_prompt_.empty() ? nullptr : initial_prompt_.c_str();

    // Group values <= 0 keep the engine default
    const int best_of = groupInt(params_, "greedy", "best_of");
    if (best_of > 0) {
        wparams.greedy.best_of = best_of;
    }
    const int beam_size = groupInt(params_, "beam_search", "beam_size");
    if (beam_size > 0) {
        wparams.beam_search.beam_size = beam_size;
    }
    const float patience = groupFloat(params_, "beam_search", "patience");
    if (patience > 0.0f) {
        wparams.beam_search.patience = patience;
    }
}

bool WhisperBackend::abortCallback(void* user_data) {
    const auto* backend = static_cast<const WhisperBackend*>(user_data);
    return backend && backend->cancel_token_ && backend->cancel_token_->isCancelled();
}

ErrorInfo WhisperBackend::checkAudio(const AudioData& audio) {
    if (audio.channels != 1) {
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Audio must be mono",
            "got " + std::to_string(audio.channels) + " channel(s)");
    }
    if (audio.sample_rate != SAMPLE_RATE) {
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_SAMPLE_RATE,
            "Audio must be " + std::to_string(SAMPLE_RATE) + " Hz",
            "got " + std::to_string(audio.sample_rate) + " Hz");
    }
    return ErrorInfo::ok();
}

void WhisperBackend::newSegmentCallback(whisper_context* /*ctx*/, whisper_state* state,
        int n_new, void* user_data) {
    auto* backend = static_cast<WhisperBackend*>(user_data);
    if (!backend || !backend->callback_) {
        return;
    }

    const int n_segments = whisper_full_n_segments_from_state(state);
    for (int i = n_segments - n_new; i < n_segments; ++i) {
        Segment segment;
        segment.begin_time_ms = toMs(whisper_full_get_segment_t0_from_state(state, i));
        segment.end_time_ms = toMs(whisper_full_get_segment_t1_from_state(state, i));
        const char* text = whisper_full_get_segment_text_from_state(state, i);
        segment.text = text ? text : "";
        backend->notifySegment(segment);
    }
}

ErrorInfo WhisperBackend::transcribe(const AudioData& audio,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) {
    segments.clear();

    if (!ctx_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Backend not initialized");
    }

    auto err = checkAudio(audio);
    if (!err.isOk()) {
        return err;
    }

    const int beam_size = groupInt(params_, "beam_search", "beam_size");
    whisper_full_params wparams = whisper_full_default_params(
        beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);

    try {
        applyParams(wparams);
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid engine parameter", e.what());
    }

    wparams.abort_callback = &WhisperBackend::abortCallback;
    wparams.abort_callback_user_data = this;
    wparams.new_segment_callback = &WhisperBackend::newSegmentCallback;
    wparams.new_segment_callback_user_data = this;

    const int n_processors = options.n_processors > 0 ? options.n_processors : 1;

    cancel_token_ = options.cancel_token;
    int rc = 0;
    try {
        rc = whisper_full_parallel(ctx_.get(), wparams, audio.samples.data(),
            static_cast<int>(audio.samples.size()), n_processors);
    } catch (const std::exception& e) {
        cancel_token_ = nullptr;
        return ErrorInfo::error(ErrorCode::INFERENCE_FAILED, "whisper inference failed", e.what());
    }
    cancel_token_ = nullptr;

    if (options.cancel_token && options.cancel_token->isCancelled()) {
        return ErrorInfo::error(ErrorCode::CANCELLED, "Transcription cancelled");
    }

    if (rc != 0) {
        return ErrorInfo::error(ErrorCode::INFERENCE_FAILED,
            "whisper_full_parallel failed", "return code " + std::to_string(rc));
    }

    const int n_segments = whisper_full_n_segments(ctx_.get());
    segments.reserve(n_segments);
    for (int i = 0; i < n_segments; ++i) {
        Segment segment;
        segment.begin_time_ms = toMs(whisper_full_get_segment_t0(ctx_.get(), i));
        segment.end_time_ms = toMs(whisper_full_get_segment_t1(ctx_.get(), i));
        const char* text = whisper_full_get_segment_text(ctx_.get(), i);
        segment.text = text ? text : "";
        segments.push_back(std::move(segment));
    }

    return ErrorInfo::ok();
}

ErrorInfo WhisperBackend::transcribeFile(const std::string& file_path,
        const TranscribeOptions& options,
        std::vector<Segment>& segments) {
    segments.clear();

    if (!ctx_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Backend not initialized");
    }

    AudioData audio;
    auto err = AudioLoader::load(file_path, audio, SAMPLE_RATE);
    if (!err.isOk()) {
        return err;
    }

    return transcribe(audio, options, segments);
}

void WhisperBackend::printTimings() {
    if (ctx_) {
        whisper_print_timings(ctx_.get());
    }
}

}  // namespace scribe
