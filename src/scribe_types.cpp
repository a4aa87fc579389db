#include "scribe/scribe_types.hpp"

#include <sstream>
#include <string>

namespace scribe {

std::string segmentToString(const Segment& segment) {
    std::ostringstream oss;
    oss << "t0=" << segment.begin_time_ms
        << ", t1=" << segment.end_time_ms
        << ", text=" << segment.text;
    return oss.str();
}

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                      return "OK";
        case ErrorCode::INVALID_CONFIG:          return "INVALID_CONFIG";
        case ErrorCode::MODEL_NOT_FOUND:         return "MODEL_NOT_FOUND";
        case ErrorCode::UNSUPPORTED_FORMAT:      return "UNSUPPORTED_FORMAT";
        case ErrorCode::UNSUPPORTED_SAMPLE_RATE: return "UNSUPPORTED_SAMPLE_RATE";
        case ErrorCode::INVALID_ARGUMENT:        return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:         return "NOT_INITIALIZED";
        case ErrorCode::ALREADY_STARTED:         return "ALREADY_STARTED";
        case ErrorCode::INFERENCE_FAILED:        return "INFERENCE_FAILED";
        case ErrorCode::CANCELLED:               return "CANCELLED";
        case ErrorCode::DEVICE_ERROR:            return "DEVICE_ERROR";
        case ErrorCode::NETWORK_ERROR:           return "NETWORK_ERROR";
        case ErrorCode::DOWNLOAD_FAILED:         return "DOWNLOAD_FAILED";
        case ErrorCode::INTERNAL_ERROR:          return "INTERNAL_ERROR";
        case ErrorCode::IO_ERROR:                return "IO_ERROR";
        default:                                 return "UNKNOWN";
    }
}

}  // namespace scribe
