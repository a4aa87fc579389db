#include "scribe/audio/recorder.hpp"

#include <portaudio.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace scribe {

namespace {

// Closes the stream on every exit path of record()
struct StreamGuard {
    PaStream* stream = nullptr;

    ~StreamGuard() {
        if (stream) {
            if (Pa_IsStreamActive(stream) == 1) {
                Pa_StopStream(stream);
            }
            Pa_CloseStream(stream);
        }
    }
};

ErrorInfo paError(const std::string& what, PaError err) {
    return ErrorInfo::error(ErrorCode::DEVICE_ERROR, what, Pa_GetErrorText(err));
}

}  // namespace

Recorder::Recorder()
    : config_(Config{})
{
}

Recorder::Recorder(const Config& config)
    : config_(config)
{
}

Recorder::~Recorder() {
    if (pa_initialized_) {
        Pa_Terminate();
    }
}

ErrorInfo Recorder::ensureInitialized() {
    if (pa_initialized_) {
        return ErrorInfo::ok();
    }
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return paError("Failed to initialize PortAudio", err);
    }
    pa_initialized_ = true;
    return ErrorInfo::ok();
}

ErrorInfo Recorder::record(int duration_s, AudioData& audio,
        const CancellationToken* cancel_token) {
    if (duration_s <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Duration must be > 0 seconds, got " + std::to_string(duration_s));
    }
    if (config_.sample_rate <= 0 || config_.channels <= 0 || config_.frames_per_read == 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid recorder configuration");
    }

    auto err = ensureInitialized();
    if (!err.isOk()) {
        return err;
    }

    const PaDeviceIndex dev = config_.device_index >= 0
        ? static_cast<PaDeviceIndex>(config_.device_index)
        : Pa_GetDefaultInputDevice();
    if (dev == paNoDevice || dev >= Pa_GetDeviceCount()) {
        return ErrorInfo::error(ErrorCode::DEVICE_ERROR, "No input device available");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(dev);
    if (!info || info->maxInputChannels < config_.channels) {
        return ErrorInfo::error(ErrorCode::DEVICE_ERROR,
            "Input device does not support " + std::to_string(config_.channels) + " channel(s)");
    }
    const std::string device_name = info->name ? info->name : "";

    PaStreamParameters in_params{};
    in_params.device = dev;
    in_params.channelCount = config_.channels;
    in_params.sampleFormat = paFloat32;
    in_params.suggestedLatency = info->defaultLowInputLatency;
    in_params.hostApiSpecificStreamInfo = nullptr;

    StreamGuard guard;
    PaError pa_err = Pa_OpenStream(&guard.stream, &in_params, nullptr,
        config_.sample_rate, config_.frames_per_read, paNoFlag, nullptr, nullptr);
    if (pa_err != paNoError) {
        guard.stream = nullptr;
        return paError("Failed to open input stream on " + device_name, pa_err);
    }

    pa_err = Pa_StartStream(guard.stream);
    if (pa_err != paNoError) {
        return paError("Failed to start input stream", pa_err);
    }

    const int64_t total_frames = static_cast<int64_t>(duration_s) * config_.sample_rate;
    audio.samples.clear();
    audio.samples.reserve(static_cast<size_t>(total_frames) * config_.channels);
    audio.sample_rate = config_.sample_rate;
    audio.channels = config_.channels;

    std::vector<float> buffer(config_.frames_per_read * config_.channels);
    int64_t captured = 0;

    while (captured < total_frames) {
        if (cancel_token && cancel_token->isCancelled()) {
            return ErrorInfo::error(ErrorCode::CANCELLED, "Recording cancelled");
        }

        const auto frames = static_cast<unsigned long>(  // NOLINT(runtime/int)
            std::min<int64_t>(config_.frames_per_read, total_frames - captured));
        pa_err = Pa_ReadStream(guard.stream, buffer.data(), frames);
        if (pa_err == paInputOverflowed) {
            std::cerr << "[Recorder] Input overflowed, samples dropped" << std::endl;
        } else if (pa_err != paNoError) {
            return paError("Failed to read input stream", pa_err);
        }

        audio.samples.insert(audio.samples.end(), buffer.begin(),
            buffer.begin() + static_cast<std::ptrdiff_t>(frames * config_.channels));
        captured += static_cast<int64_t>(frames);
    }

    return ErrorInfo::ok();
}

}  // namespace scribe
