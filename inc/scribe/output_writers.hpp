#ifndef SCRIBE_OUTPUT_WRITERS_HPP
#define SCRIBE_OUTPUT_WRITERS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "scribe_types.hpp"

namespace scribe {

enum class OutputFormat {
    TXT,
    VTT,
    SRT,
    CSV,
};

const char* outputFormatToString(OutputFormat format);

/// @brief Which writers run after a successful transcription
struct OutputOptions {
    bool txt = false;
    bool vtt = false;
    bool srt = false;
    bool csv = false;

    bool any() const { return txt || vtt || srt || csv; }

    /// @brief Enabled formats in invocation order: txt, vtt, srt, csv
    std::vector<OutputFormat> enabled() const;
};

// =============================================================================
// Output Writers (输出格式)
// =============================================================================

/// @brief "HH:MM:SS.mmm", or "HH:MM:SS,mmm" with comma = true (SubRip)
std::string toTimestamp(int64_t ms, bool comma = false);

/// @brief Source path with its extension replaced ("a.wav" -> "a.srt")
std::string outputPathFor(const std::string& source_path, OutputFormat format);

class OutputWriter {
public:
    /// @brief Write segments next to the source file
    /// @param format output format
    /// @param segments transcript segments
    /// @param source_path media file the segments come from
    /// @param written_path [out] path of the written file
    /// @return IO_ERROR if the output file cannot be written
    static ErrorInfo write(OutputFormat format,
        const std::vector<Segment>& segments,
        const std::string& source_path,
        std::string& written_path);

    static ErrorInfo writeTxt(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path);
    static ErrorInfo writeVtt(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path);
    static ErrorInfo writeSrt(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path);
    static ErrorInfo writeCsv(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path);
};

}  // namespace scribe

#endif  // SCRIBE_OUTPUT_WRITERS_HPP
