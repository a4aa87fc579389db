#ifndef SCRIBE_RECORDING_HPP
#define SCRIBE_RECORDING_HPP

#include <memory>
#include <string>
#include <vector>

#include "audio/recorder.hpp"
#include "cancellation.hpp"
#include "engine.hpp"
#include "params.hpp"
#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// Recording (录音转写)
// =============================================================================
//
// Records a fixed duration from the microphone and transcribes it. Segments
// are printed live by whisper.cpp (print_realtime is forced on).
//
//   scribe::Recording rec(5);
//   auto err = rec.start();
//

class Recording {
public:
    /// @param duration_s seconds to record
    /// @param model model file path or model name
    /// @param engine_args extra engine arguments, resolved like the CLI flags
    explicit Recording(int duration_s, const std::string& model = "tiny.en",
        const ArgumentSet& engine_args = {});

    /// @brief Record, transcribe, print timings
    /// @param segments [out] optional, receives the transcript
    ErrorInfo start(std::vector<Segment>* segments = nullptr);

    void setCancellationToken(const CancellationToken* token) { cancel_token_ = token; }

    int getDuration() const { return duration_s_; }

    const ResolvedParams& getParams() const { return params_; }

private:
    int duration_s_;
    std::string model_;
    ResolvedParams params_;
    const CancellationToken* cancel_token_ = nullptr;

    Recorder recorder_;
    std::unique_ptr<Engine> engine_;
};

}  // namespace scribe

#endif  // SCRIBE_RECORDING_HPP
