#ifndef SCRIBE_BATCH_RUNNER_HPP
#define SCRIBE_BATCH_RUNNER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "engine.hpp"
#include "output_writers.hpp"
#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// Batch Runner (批量转写)
// =============================================================================

/// @brief Per-file state, PENDING -> PROCESSING -> SUCCEEDED | FAILED
enum class FileState {
    PENDING,
    PROCESSING,
    SUCCEEDED,
    FAILED,
};

const char* fileStateToString(FileState state);

struct FileResult {
    std::string file;
    FileState state = FileState::PENDING;
    std::vector<Segment> segments;       // only set when SUCCEEDED
    ErrorInfo error;                     // only set when FAILED
    std::vector<std::string> outputs;    // written output paths
};

struct BatchResult {
    std::vector<FileResult> files;       // input order
    bool interrupted = false;

    size_t succeeded() const;
    size_t failed() const;
};

/// Transcribes files one at a time in input order. A failing file is logged
/// and skipped, an interrupt stops the loop and leaves the rest PENDING.
class BatchRunner {
public:
    BatchRunner(Engine& engine, const OutputOptions& outputs, int n_processors,
        const CancellationToken* cancel_token = nullptr);

    BatchResult run(const std::vector<std::string>& media_files);

private:
    Engine& engine_;
    OutputOptions outputs_;
    int n_processors_;
    const CancellationToken* cancel_token_;

    bool cancelled() const { return cancel_token_ && cancel_token_->isCancelled(); }

    void processFile(FileResult& result);
    void writeOutputs(FileResult& result);
};

}  // namespace scribe

#endif  // SCRIBE_BATCH_RUNNER_HPP
