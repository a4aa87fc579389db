#include "scribe/output_writers.hpp"

#include <cstdio>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <string>
#include <vector>

namespace scribe {

const char* outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::TXT: return "txt";
        case OutputFormat::VTT: return "vtt";
        case OutputFormat::SRT: return "srt";
        case OutputFormat::CSV: return "csv";
        default:                return "unknown";
    }
}

std::vector<OutputFormat> OutputOptions::enabled() const {
    std::vector<OutputFormat> formats;
    if (txt) formats.push_back(OutputFormat::TXT);
    if (vtt) formats.push_back(OutputFormat::VTT);
    if (srt) formats.push_back(OutputFormat::SRT);
    if (csv) formats.push_back(OutputFormat::CSV);
    return formats;
}

std::string toTimestamp(int64_t ms, bool comma) {
    if (ms < 0) {
        ms = 0;
    }
    const int64_t hr = ms / (1000 * 60 * 60);
    ms -= hr * (1000 * 60 * 60);
    const int64_t min = ms / (1000 * 60);
    ms -= min * (1000 * 60);
    const int64_t sec = ms / 1000;
    ms -= sec * 1000;

    char buf[32];
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d%s%03d",
        static_cast<int>(hr), static_cast<int>(min), static_cast<int>(sec),
        comma ? "," : ".", static_cast<int>(ms));
    return std::string(buf);
}

std::string outputPathFor(const std::string& source_path, OutputFormat format) {
    std::filesystem::path path(source_path);
    path.replace_extension(std::string(".") + outputFormatToString(format));
    return path.string();
}

namespace {

ErrorInfo openOutput(const std::string& path, std::ofstream& fout) {
    fout.open(path, std::ios::out | std::ios::trunc);
    if (!fout.is_open()) {
        return ErrorInfo::error(ErrorCode::IO_ERROR,
            "Failed to open '" + path + "' for writing");
    }
    return ErrorInfo::ok();
}

ErrorInfo finish(std::ofstream& fout, const std::string& path) {
    fout.close();
    if (fout.fail()) {
        return ErrorInfo::error(ErrorCode::IO_ERROR, "Failed to write '" + path + "'");
    }
    return ErrorInfo::ok();
}

std::string escapeDoubleQuotesAndBackslashes(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

}  // namespace

ErrorInfo OutputWriter::write(OutputFormat format,
        const std::vector<Segment>& segments,
        const std::string& source_path,
        std::string& written_path) {
    switch (format) {
        case OutputFormat::TXT: return writeTxt(segments, source_path, written_path);
        case OutputFormat::VTT: return writeVtt(segments, source_path, written_path);
        case OutputFormat::SRT: return writeSrt(segments, source_path, written_path);
        case OutputFormat::CSV: return writeCsv(segments, source_path, written_path);
        default:
            return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT, "Unknown output format");
    }
}

ErrorInfo OutputWriter::writeTxt(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path) {
    const std::string path = outputPathFor(source_path, OutputFormat::TXT);
    std::ofstream fout;
    auto err = openOutput(path, fout);
    if (!err.isOk()) {
        return err;
    }

    for (const auto& segment : segments) {
        fout << segment.text << "\n";
    }

    err = finish(fout, path);
    if (err.isOk()) {
        written_path = path;
    }
    return err;
}

ErrorInfo OutputWriter::writeVtt(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path) {
    const std::string path = outputPathFor(source_path, OutputFormat::VTT);
    std::ofstream fout;
    auto err = openOutput(path, fout);
    if (!err.isOk()) {
        return err;
    }

    fout << "WEBVTT\n\n";
    for (const auto& segment : segments) {
        fout << toTimestamp(segment.begin_time_ms) << " --> "
            << toTimestamp(segment.end_time_ms) << "\n";
        fout << segment.text << "\n\n";
    }

    err = finish(fout, path);
    if (err.isOk()) {
        written_path = path;
    }
    return err;
}

ErrorInfo OutputWriter::writeSrt(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path) {
    const std::string path = outputPathFor(source_path, OutputFormat::SRT);
    std::ofstream fout;
    auto err = openOutput(path, fout);
    if (!err.isOk()) {
        return err;
    }

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        fout << i + 1 << "\n";
        fout << toTimestamp(segment.begin_time_ms, true) << " --> "
            << toTimestamp(segment.end_time_ms, true) << "\n";
        fout << segment.text << "\n\n";
    }

    err = finish(fout, path);
    if (err.isOk()) {
        written_path = path;
    }
    return err;
}

ErrorInfo OutputWriter::writeCsv(const std::vector<Segment>& segments,
        const std::string& source_path, std::string& written_path) {
    const std::string path = outputPathFor(source_path, OutputFormat::CSV);
    std::ofstream fout;
    auto err = openOutput(path, fout);
    if (!err.isOk()) {
        return err;
    }

    fout << "start,end,text\n";
    for (const auto& segment : segments) {
        fout << segment.begin_time_ms << "," << segment.end_time_ms << ","
            << "\"" << escapeDoubleQuotesAndBackslashes(segment.text) << "\"\n";
    }

    err = finish(fout, path);
    if (err.isOk()) {
        written_path = path;
    }
    return err;
}

}  // namespace scribe
