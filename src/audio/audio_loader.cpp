#include "scribe/audio/audio_loader.hpp"

#include <sndfile.h>

#include <cstring>
#include <string>
#include <vector>

namespace scribe {

std::vector<float> AudioLoader::downmix(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }

    const size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * channels + ch];
        }
        mono[i] = sum / channels;
    }
    return mono;
}

ErrorInfo AudioLoader::load(const std::string& file_path, AudioData& audio, int required_rate) {
    SF_INFO sf_info;
    memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* file = sf_open(file_path.c_str(), SFM_READ, &sf_info);
    if (!file) {
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Failed to open audio file: " + file_path,
            sf_strerror(nullptr));
    }

    if (required_rate > 0 && sf_info.samplerate != required_rate) {
        sf_close(file);
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_SAMPLE_RATE,
            "Unsupported sample rate: " + std::to_string(sf_info.samplerate) + " Hz",
            "only " + std::to_string(required_rate) + " Hz input is supported, "
            "resample " + file_path + " first");
    }

    std::vector<float> data(static_cast<size_t>(sf_info.frames) * sf_info.channels);
    sf_count_t samples_read = sf_read_float(file, data.data(), data.size());
    sf_close(file);

    if (samples_read <= 0) {
        return ErrorInfo::error(ErrorCode::IO_ERROR,
            "Failed to read audio data from file: " + file_path);
    }
    data.resize(static_cast<size_t>(samples_read));

    audio.samples = downmix(data, sf_info.channels);
    audio.sample_rate = sf_info.samplerate;
    audio.channels = 1;

    return ErrorInfo::ok();
}

}  // namespace scribe
