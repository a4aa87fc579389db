#ifndef SCRIBE_AUDIO_LOADER_HPP
#define SCRIBE_AUDIO_LOADER_HPP

#include <string>
#include <vector>

#include "../scribe_types.hpp"

namespace scribe {

// =============================================================================
// Audio Loader (音频文件读取)
// =============================================================================

class AudioLoader {
public:
    /// @brief Decode an audio file into mono float PCM
    /// @param file_path any format libsndfile can read
    /// @param audio [out] mono samples, sample_rate of the file
    /// @param required_rate rejected with UNSUPPORTED_SAMPLE_RATE when the
    ///        file rate differs, 0 accepts any rate
    static ErrorInfo load(const std::string& file_path, AudioData& audio,
        int required_rate = SAMPLE_RATE);

    /// @brief Average interleaved channels into one
    static std::vector<float> downmix(const std::vector<float>& interleaved, int channels);
};

}  // namespace scribe

#endif  // SCRIBE_AUDIO_LOADER_HPP
