#include "scribe/batch_runner.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace scribe {

const char* fileStateToString(FileState state) {
    switch (state) {
        case FileState::PENDING:    return "PENDING";
        case FileState::PROCESSING: return "PROCESSING";
        case FileState::SUCCEEDED:  return "SUCCEEDED";
        case FileState::FAILED:     return "FAILED";
        default:                    return "UNKNOWN";
    }
}

size_t BatchResult::succeeded() const {
    size_t n = 0;
    for (const auto& f : files) {
        if (f.state == FileState::SUCCEEDED) ++n;
    }
    return n;
}

size_t BatchResult::failed() const {
    size_t n = 0;
    for (const auto& f : files) {
        if (f.state == FileState::FAILED) ++n;
    }
    return n;
}

BatchRunner::BatchRunner(Engine& engine, const OutputOptions& outputs, int n_processors,
        const CancellationToken* cancel_token)
    : engine_(engine)
    , outputs_(outputs)
    , n_processors_(n_processors)
    , cancel_token_(cancel_token)
{
}

BatchResult BatchRunner::run(const std::vector<std::string>& media_files) {
    BatchResult batch;
    batch.files.reserve(media_files.size());
    for (const auto& file : media_files) {
        FileResult r;
        r.file = file;
        batch.files.push_back(std::move(r));
    }

    for (auto& result : batch.files) {
        if (cancelled()) {
            batch.interrupted = true;
            break;
        }

        processFile(result);

        if (result.state == FileState::FAILED && result.error.code == ErrorCode::CANCELLED) {
            std::cout << "[Batch] Transcription manually stopped" << std::endl;
            batch.interrupted = true;
            break;
        }
    }

    if (batch.interrupted && !batch.files.empty()) {
        std::cout << "[Batch] " << batch.succeeded() << " of " << batch.files.size()
                  << " files done before interruption" << std::endl;
    }

    return batch;
}

void BatchRunner::processFile(FileResult& result) {
    std::cout << "[Batch] Processing file " << result.file << " ..." << std::endl;
    result.state = FileState::PROCESSING;

    // Fresh per file, nothing from a previous iteration leaks into the outputs
    std::vector<Segment> segments;

    TranscribeOptions options;
    options.n_processors = n_processors_;
    options.cancel_token = cancel_token_;

    ErrorInfo err;
    try {
        err = engine_.transcribe(result.file, options, segments);
    } catch (const std::exception& e) {
        err = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (!err.isOk()) {
        result.state = FileState::FAILED;
        result.error = err;
        if (err.code != ErrorCode::CANCELLED) {
            std::cerr << "[Batch] Error while processing file " << result.file
                      << ": " << err.describe() << std::endl;
        }
        return;
    }

    result.segments = std::move(segments);
    result.state = FileState::SUCCEEDED;

    engine_.printTimings();

    // The csv writer replaces the per-segment console listing
    if (!outputs_.csv) {
        char index[16];
        for (size_t i = 0; i < result.segments.size(); ++i) {
            std::snprintf(index, sizeof(index), "%02zu", i);
            std::cout << "[Batch] Segment " << index << ": "
                      << segmentToString(result.segments[i]) << std::endl;
        }
    }

    // Nothing to save for an empty transcript
    if (!result.segments.empty()) {
        writeOutputs(result);
    }
}

void BatchRunner::writeOutputs(FileResult& result) {
    for (OutputFormat format : outputs_.enabled()) {
        const char* name = outputFormatToString(format);
        std::cout << "[Batch] Saving result as a " << name << " file ..." << std::endl;

        std::string path;
        auto err = OutputWriter::write(format, result.segments, result.file, path);
        if (!err.isOk()) {
            // Transcript is still good, keep the file SUCCEEDED
            std::cerr << "[Batch] Could not write " << name << " file for "
                      << result.file << ": " << err.describe() << std::endl;
            continue;
        }

        std::cout << "[Batch] " << name << " file saved to " << path << std::endl;
        result.outputs.push_back(path);
    }
}

}  // namespace scribe
