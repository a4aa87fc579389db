#include "scribe/params.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace scribe {

// =============================================================================
// Param Values
// =============================================================================

const char* paramTypeToString(ParamType type) {
    switch (type) {
        case ParamType::BOOL:   return "bool";
        case ParamType::INT:    return "int";
        case ParamType::FLOAT:  return "float";
        case ParamType::STRING: return "str";
        case ParamType::GROUP:  return "group";
        default:                return "unknown";
    }
}

namespace {

struct ValuePrinter {
    std::ostringstream& os;

    void operator()(bool v) const { os << (v ? "true" : "false"); }
    void operator()(int32_t v) const { os << v; }
    void operator()(float v) const { os << v; }
    void operator()(const std::string& v) const { os << std::quoted(v); }
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

std::string paramValueToString(const ParamValue& value) {
    std::ostringstream oss;
    std::visit(ValuePrinter{oss}, value);
    return oss.str();
}

ErrorInfo parseParamValue(ParamType type, const std::string& text, ParamValue& value) {
    switch (type) {
        case ParamType::BOOL: {
            const std::string lowered = toLower(text);
            if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
                value = true;
                return ErrorInfo::ok();
            }
            if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
                value = false;
                return ErrorInfo::ok();
            }
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "invalid bool value: '" + text + "'");
        }

        case ParamType::INT: {
            if (text.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "invalid int value: ''");
            }
            char* end = nullptr;
            const long parsed = std::strtol(text.c_str(), &end, 10);
            if (end == nullptr || *end != '\0' ||
                parsed < INT32_MIN || parsed > INT32_MAX) {
                return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                    "invalid int value: '" + text + "'");
            }
            value = static_cast<int32_t>(parsed);
            return ErrorInfo::ok();
        }

        case ParamType::FLOAT: {
            if (text.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "invalid float value: ''");
            }
            char* end = nullptr;
            const float parsed = std::strtof(text.c_str(), &end);
            if (end == nullptr || *end != '\0') {
                return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                    "invalid float value: '" + text + "'");
            }
            value = parsed;
            return ErrorInfo::ok();
        }

        case ParamType::STRING:
            value = text;
            return ErrorInfo::ok();

        case ParamType::GROUP:
        default:
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "group parameters take no direct value");
    }
}

bool paramAsBool(const ParamValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* i = std::get_if<int32_t>(&value)) return *i != 0;
    if (const auto* f = std::get_if<float>(&value)) return *f != 0.0f;
    return !std::get<std::string>(value).empty();
}

int32_t paramAsInt(const ParamValue& value) {
    if (const auto* i = std::get_if<int32_t>(&value)) return *i;
    if (const auto* f = std::get_if<float>(&value)) return static_cast<int32_t>(*f);
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1 : 0;
    return 0;
}

float paramAsFloat(const ParamValue& value) {
    if (const auto* f = std::get_if<float>(&value)) return *f;
    if (const auto* i = std::get_if<int32_t>(&value)) return static_cast<float>(*i);
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1.0f : 0.0f;
    return 0.0f;
}

std::string paramAsString(const ParamValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return paramValueToString(value);
}

// =============================================================================
// Param Schema
// =============================================================================

ParamSchema::ParamSchema(std::vector<ParamDescriptor> params)
    : params_(std::move(params))
{
    for (size_t i = 0; i < params_.size(); ++i) {
        index_.emplace(params_[i].name, i);
    }
}

bool ParamSchema::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

const ParamDescriptor* ParamSchema::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &params_[it->second];
}

const ParamField* ParamSchema::findField(const std::string& group, const std::string& field) const {
    const ParamDescriptor* desc = find(group);
    if (!desc || desc->type != ParamType::GROUP) {
        return nullptr;
    }
    for (const auto& f : desc->fields) {
        if (f.name == field) {
            return &f;
        }
    }
    return nullptr;
}

const ParamSchema& ParamSchema::whisper() {
    static const ParamSchema schema({
        {"n_threads", ParamType::INT, std::nullopt,
            "number of threads to use during computation, defaults to min(4, hardware concurrency)", {}},
        {"n_max_text_ctx", ParamType::INT, ParamValue(16384),
            "max tokens to use from past text as prompt for the decoder", {}},
        {"offset_ms", ParamType::INT, ParamValue(0), "start offset in ms", {}},
        {"duration_ms", ParamType::INT, ParamValue(0), "audio duration to process in ms", {}},
        {"translate", ParamType::BOOL, ParamValue(false), "translate the audio to English", {}},
        {"no_context", ParamType::BOOL, ParamValue(false),
            "do not use past transcription (if any) as initial prompt for the decoder", {}},
        {"no_timestamps", ParamType::BOOL, ParamValue(false), "do not generate timestamps", {}},
        {"single_segment", ParamType::BOOL, ParamValue(false), "force single segment output", {}},
        {"print_special", ParamType::BOOL, ParamValue(false),
            "print special tokens (e.g. <SOT>, <EOT>, <BEG>, etc.)", {}},
        {"print_progress", ParamType::BOOL, ParamValue(true), "print progress information", {}},
        {"print_realtime", ParamType::BOOL, ParamValue(false),
            "print results from within whisper.cpp", {}},
        {"print_timestamps", ParamType::BOOL, ParamValue(true),
            "print timestamps for each text segment when printing realtime", {}},
        {"token_timestamps", ParamType::BOOL, ParamValue(false), "enable token-level timestamps", {}},
        {"thold_pt", ParamType::FLOAT, ParamValue(0.01f),
            "timestamp token probability threshold (~0.01)", {}},
        {"thold_ptsum", ParamType::FLOAT, ParamValue(0.01f),
            "timestamp token sum probability threshold (~0.01)", {}},
        {"max_len", ParamType::INT, ParamValue(0), "max segment length in characters", {}},
        {"split_on_word", ParamType::BOOL, ParamValue(false),
            "split on word rather than on token (when used with max_len)", {}},
        {"max_tokens", ParamType::INT, ParamValue(0), "max tokens per segment (0 = no limit)", {}},
        {"debug_mode", ParamType::BOOL, ParamValue(false), "enable debug output", {}},
        {"audio_ctx", ParamType::INT, ParamValue(0),
            "overwrite the audio context size (0 = use default)", {}},
        {"tdrz_enable", ParamType::BOOL, ParamValue(false),
            "enable tinydiarize speaker turn detection", {}},
        {"initial_prompt", ParamType::STRING, std::nullopt,
            "initial prompt, prepended to any existing text context", {}},
        {"language", ParamType::STRING, ParamValue(std::string()),
            "spoken language, \"\" or \"auto\" for auto-detection", {}},
        {"detect_language", ParamType::BOOL, ParamValue(false), "exit after automatically detecting language", {}},
        {"suppress_blank", ParamType::BOOL, ParamValue(true), "suppress blank outputs", {}},
        {"temperature", ParamType::FLOAT, ParamValue(0.0f), "initial decoding temperature", {}},
        {"max_initial_ts", ParamType::FLOAT, ParamValue(1.0f), "max initial timestamp", {}},
        {"length_penalty", ParamType::FLOAT, ParamValue(-1.0f), "length penalty", {}},
        {"temperature_inc", ParamType::FLOAT, ParamValue(0.2f), "temperature increment on fallback", {}},
        {"entropy_thold", ParamType::FLOAT, ParamValue(2.4f),
            "similar to OpenAI's \"compression_ratio_threshold\"", {}},
        {"logprob_thold", ParamType::FLOAT, ParamValue(-1.0f), "log probability threshold", {}},
        {"no_speech_thold", ParamType::FLOAT, ParamValue(0.6f), "no speech threshold", {}},
        {"greedy", ParamType::GROUP, std::nullopt, "greedy sampling", {
            {"best_of", ParamType::INT, ParamValue(-1)},
        }},
        {"beam_search", ParamType::GROUP, std::nullopt, "beam search sampling", {
            {"beam_size", ParamType::INT, ParamValue(-1)},
            {"patience", ParamType::FLOAT, ParamValue(-1.0f)},
        }},
    });
    return schema;
}

// =============================================================================
// Param Mapping
// =============================================================================

ParamPath ParamPath::parse(const std::string& path) {
    ParamPath result;
    const size_t dot = path.find('.');
    if (dot == std::string::npos) {
        result.group = path;
    } else {
        result.group = path.substr(0, dot);
        result.field = path.substr(dot + 1);
    }
    return result;
}

ParamMapping::ParamMapping(std::vector<Entry> entries)
    : entries_(std::move(entries))
{
    for (const auto& entry : entries_) {
        forward_.emplace(entry.first, entry.second);
        if (!inverse_.emplace(entry.second, entry.first).second) {
            duplicates_.push_back(entry.second);
        }
    }
}

const ParamMapping& ParamMapping::whisper() {
    static const ParamMapping mapping({
        {"n_threads", "threads"},
        {"initial_prompt", "prompt"},
        {"tdrz_enable", "tinydiarize"},
        {"greedy.best_of", "best_of"},
        {"beam_search.beam_size", "beam_size"},
        {"beam_search.patience", "beam_patience"},
    });
    return mapping;
}

std::optional<std::string> ParamMapping::externalName(const std::string& canonical) const {
    auto it = forward_.find(canonical);
    if (it == forward_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ParamMapping::canonicalPath(const std::string& external) const {
    auto it = inverse_.find(external);
    if (it == inverse_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ErrorInfo ParamMapping::validate() const {
    if (!duplicates_.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "External name mapped more than once: " + duplicates_.front());
    }

    for (const auto& entry : entries_) {
        const std::string& path = entry.first;
        if (path.empty() || entry.second.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Empty mapping entry",
                "'" + path + "' -> '" + entry.second + "'");
        }
        if (std::count(path.begin(), path.end(), '.') > 1) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Canonical path has more than two segments: " + path);
        }
        ParamPath parsed = ParamPath::parse(path);
        if (parsed.group.empty() || (path.find('.') != std::string::npos && parsed.field.empty())) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Canonical path has an empty segment: " + path);
        }
    }

    return ErrorInfo::ok();
}

ErrorInfo ParamMapping::validate(const ParamSchema& schema) const {
    auto err = validate();
    if (!err.isOk()) {
        return err;
    }

    for (const auto& entry : entries_) {
        ParamPath path = ParamPath::parse(entry.first);
        const bool known = path.isNested()
            ? schema.findField(path.group, path.field) != nullptr
            : schema.contains(path.group);
        if (!known) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Mapped path not in schema: " + entry.first);
        }
    }

    return ErrorInfo::ok();
}

// =============================================================================
// Resolved Params
// =============================================================================

const ParamValue* ResolvedParams::find(const std::string& name) const {
    auto it = values.find(name);
    return it == values.end() ? nullptr : &it->second;
}

const ParamValue* ResolvedParams::find(const std::string& group, const std::string& field) const {
    auto git = groups.find(group);
    if (git == groups.end()) {
        return nullptr;
    }
    auto fit = git->second.find(field);
    return fit == git->second.end() ? nullptr : &fit->second;
}

std::string ResolvedParams::toString() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;

    auto separator = [&]() {
        oss << (first ? "\n" : ",\n");
        first = false;
    };

    for (const auto& kv : values) {
        separator();
        oss << "  \"" << kv.first << "\": " << paramValueToString(kv.second);
    }

    for (const auto& group : groups) {
        separator();
        oss << "  \"" << group.first << "\": {";
        bool first_field = true;
        for (const auto& field : group.second) {
            oss << (first_field ? "" : ", ")
                << "\"" << field.first << "\": " << paramValueToString(field.second);
            first_field = false;
        }
        oss << "}";
    }

    oss << (first ? "}" : "\n}");
    return oss.str();
}

// =============================================================================
// Param Resolver
// =============================================================================

ResolvedParams ParamResolver::resolve(const ArgumentSet& args,
        const ParamSchema& schema,
        const ParamMapping& mapping) {
    ResolvedParams params;

    for (const auto& arg : args) {
        // Schema names never fall through to the mapping
        if (schema.contains(arg.name)) {
            if (arg.value) {
                params.set(arg.name, *arg.value);
            }
            continue;
        }

        auto canonical = mapping.canonicalPath(arg.name);
        if (!canonical || !arg.value) {
            continue;
        }

        ParamPath path = ParamPath::parse(*canonical);
        if (path.isNested()) {
            params.set(path.group, path.field, *arg.value);
        } else {
            params.set(path.group, *arg.value);
        }
    }

    return params;
}

}  // namespace scribe
