#ifndef SCRIBE_RECORDER_HPP
#define SCRIBE_RECORDER_HPP

#include "../cancellation.hpp"
#include "../scribe_types.hpp"

namespace scribe {

// =============================================================================
// Recorder (麦克风录音)
// =============================================================================
//
// Blocking capture from a PortAudio input device. PortAudio is initialized
// for the lifetime of the Recorder.
//
//   scribe::Recorder recorder;
//   scribe::AudioData audio;
//   auto err = recorder.record(5, audio);
//

class Recorder {
public:
    struct Config {
        int sample_rate = SAMPLE_RATE;
        int channels = 1;
        int device_index = -1;              // -1 = default input device
        unsigned long frames_per_read = 1024;  // NOLINT(runtime/int)
    };

    Recorder();
    explicit Recorder(const Config& config);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    /// @brief Record for a fixed duration
    /// @param duration_s seconds to record, must be > 0
    /// @param audio [out] float samples, interleaved when channels > 1
    /// @param cancel_token checked between reads, a partial recording is kept
    /// @return DEVICE_ERROR when PortAudio fails, CANCELLED when interrupted
    ErrorInfo record(int duration_s, AudioData& audio,
        const CancellationToken* cancel_token = nullptr);

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    bool pa_initialized_ = false;

    ErrorInfo ensureInitialized();
};

}  // namespace scribe

#endif  // SCRIBE_RECORDER_HPP
