#ifndef SCRIBE_TYPES_HPP
#define SCRIBE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace scribe {

// Sample rate expected by the whisper models (Hz)
constexpr int SAMPLE_RATE = 16000;

// =============================================================================
// Segment (转写片段)
// =============================================================================

struct Segment {
    int64_t begin_time_ms = 0;      // 开始时间(毫秒)
    int64_t end_time_ms = 0;        // 结束时间(毫秒)
    std::string text;               // 片段文本
};

/// @brief One-line representation used by the console log
std::string segmentToString(const Segment& segment);

// =============================================================================
// Audio Data
// =============================================================================

struct AudioData {
    std::vector<float> samples;     // PCM float [-1.0, 1.0], interleaved if channels > 1
    int sample_rate = SAMPLE_RATE;
    int channels = 1;

    int64_t durationMs() const {
        if (sample_rate <= 0 || channels <= 0) {
            return 0;
        }
        return static_cast<int64_t>(samples.size() / channels) * 1000 / sample_rate;
    }
};

// =============================================================================
// Error Info (错误信息)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    MODEL_NOT_FOUND = 101,
    UNSUPPORTED_FORMAT = 102,
    UNSUPPORTED_SAMPLE_RATE = 103,
    INVALID_ARGUMENT = 104,

    // 运行时错误 (2xx)
    NOT_INITIALIZED = 200,
    ALREADY_STARTED = 201,
    INFERENCE_FAILED = 203,
    CANCELLED = 205,
    DEVICE_ERROR = 206,

    // 网络错误 (3xx)
    NETWORK_ERROR = 300,
    DOWNLOAD_FAILED = 301,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
    IO_ERROR = 401,
};

const char* errorCodeToString(ErrorCode code);

struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string detail;         // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }

    /// @brief "message (detail)" or just the message
    std::string describe() const {
        if (detail.empty()) {
            return message;
        }
        return message + " (" + detail + ")";
    }
};

// =============================================================================
// Backend Type (后端类型)
// =============================================================================

enum class BackendType {
    WHISPER,        // whisper.cpp (本地)
    CUSTOM,         // 自定义后端
};

}  // namespace scribe

#endif  // SCRIBE_TYPES_HPP
