#include "scribe/cli_config.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace scribe {

namespace {

const char* const kBuiltinLongFlags[] = {
    "--help",
    "--version",
    "--model",
    "--processors",
    "--output-txt",
    "--output-vtt",
    "--output-srt",
    "--output-csv",
};

std::string toFlag(const std::string& name) {
    std::string flag = "--" + name;
    std::replace(flag.begin(), flag.end(), '_', '-');
    return flag;
}

// Short spellings accepted verbatim (no prefix matching for single dash)
std::string expandShortFlag(const std::string& arg) {
    if (arg == "-h") return "--help";
    if (arg == "-m") return "--model";
    if (arg == "-otxt") return "--output-txt";
    if (arg == "-ovtt") return "--output-vtt";
    if (arg == "-osrt") return "--output-srt";
    if (arg == "-ocsv") return "--output-csv";
    return "";
}

std::string metavarFor(ParamType type) {
    switch (type) {
        case ParamType::BOOL:   return "[BOOL]";
        case ParamType::INT:    return "N";
        case ParamType::FLOAT:  return "F";
        case ParamType::STRING: return "TEXT";
        default:                return "";
    }
}

bool setArgument(ArgumentSet& args, const std::string& name, const ParamValue& value) {
    for (auto& arg : args) {
        if (arg.name == name) {
            arg.value = value;
            return true;
        }
    }
    return false;
}

}  // namespace

// =============================================================================
// CliParser
// =============================================================================

CliParser::CliParser(const ParamSchema& schema, const ParamMapping& mapping)
    : engine_options_(deriveOptions(schema, mapping))
{
}

std::vector<CliOption> CliParser::deriveOptions(const ParamSchema& schema,
        const ParamMapping& mapping) {
    std::vector<CliOption> options;

    for (const auto& param : schema.params()) {
        if (param.type == ParamType::GROUP) {
            for (const auto& field : param.fields) {
                const std::string path = param.name + "." + field.name;
                auto mapped = mapping.externalName(path);
                if (!mapped) {
                    continue;
                }
                options.push_back({toFlag(*mapped), *mapped, field.type,
                    field.default_value, path});
            }
        } else if (auto mapped = mapping.externalName(param.name)) {
            options.push_back({toFlag(*mapped), *mapped, param.type,
                param.default_value, param.description});
        } else {
            options.push_back({toFlag(param.name), param.name, param.type,
                param.default_value, param.description});
        }
    }

    return options;
}

ErrorInfo CliParser::matchLongFlag(const std::string& flag, std::string& matched) const {
    matched.clear();

    std::vector<std::string> candidates;
    auto consider = [&](const std::string& known) {
        if (known == flag) {
            candidates.assign(1, known);
            return true;
        }
        if (known.compare(0, flag.size(), flag) == 0) {
            candidates.push_back(known);
        }
        return false;
    };

    for (const char* known : kBuiltinLongFlags) {
        if (consider(known)) {
            matched = known;
            return ErrorInfo::ok();
        }
    }
    for (const auto& option : engine_options_) {
        if (consider(option.flag)) {
            matched = option.flag;
            return ErrorInfo::ok();
        }
    }

    if (candidates.size() == 1) {
        matched = candidates.front();
    } else if (candidates.size() > 1) {
        std::string names;
        for (const auto& c : candidates) {
            names += (names.empty() ? "" : ", ") + c;
        }
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "ambiguous option: " + flag, "could match " + names);
    }
    return ErrorInfo::ok();
}

ErrorInfo CliParser::parse(int argc, const char* const* argv, CliConfig& config) const {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args, config);
}

ErrorInfo CliParser::parse(const std::vector<std::string>& args, CliConfig& config) const {
    config.engine_args.clear();
    for (const auto& option : engine_options_) {
        config.engine_args.push_back({option.dest, option.default_value});
    }

    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            config.media_files.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string name = arg;
        bool has_inline = false;
        std::string inline_value;

        if (arg.compare(0, 2, "--") == 0) {
            const size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
                has_inline = true;
            }
            std::string matched;
            auto err = matchLongFlag(name, matched);
            if (!err.isOk()) {
                return err;
            }
            if (matched.empty()) {
                config.ignored_args.push_back(arg);
                continue;
            }
            name = matched;
        } else {
            name = expandShortFlag(arg);
            if (name.empty()) {
                config.ignored_args.push_back(arg);
                continue;
            }
        }

        auto takeValue = [&](std::string& out) -> ErrorInfo {
            if (has_inline) {
                out = inline_value;
                return ErrorInfo::ok();
            }
            if (i + 1 >= args.size()) {
                return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                    "option " + name + " expects a value");
            }
            out = args[++i];
            return ErrorInfo::ok();
        };

        auto storeTrue = [&](bool& flag) -> ErrorInfo {
            if (has_inline) {
                return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                    "option " + name + " takes no value");
            }
            flag = true;
            return ErrorInfo::ok();
        };

        ErrorInfo err = ErrorInfo::ok();

        if (name == "--help") {
            err = storeTrue(config.show_help);
        } else if (name == "--version") {
            err = storeTrue(config.show_version);
        } else if (name == "--model") {
            err = takeValue(config.model);
        } else if (name == "--processors") {
            std::string text;
            err = takeValue(text);
            if (err.isOk()) {
                ParamValue value;
                err = parseParamValue(ParamType::INT, text, value);
                if (err.isOk()) {
                    config.processors = paramAsInt(value);
                }
            }
        } else if (name == "--output-txt") {
            err = storeTrue(config.outputs.txt);
        } else if (name == "--output-vtt") {
            err = storeTrue(config.outputs.vtt);
        } else if (name == "--output-srt") {
            err = storeTrue(config.outputs.srt);
        } else if (name == "--output-csv") {
            err = storeTrue(config.outputs.csv);
        } else {
            auto it = std::find_if(engine_options_.begin(), engine_options_.end(),
                [&](const CliOption& option) { return option.flag == name; });
            if (it == engine_options_.end()) {
                config.ignored_args.push_back(arg);
                continue;
            }

            ParamValue value;
            if (it->type == ParamType::BOOL && !has_inline) {
                // Optional literal: "--translate", "--translate false"
                value = true;
                if (i + 1 < args.size()) {
                    ParamValue literal;
                    if (parseParamValue(ParamType::BOOL, args[i + 1], literal).isOk()) {
                        value = literal;
                        ++i;
                    }
                }
            } else {
                std::string text;
                err = takeValue(text);
                if (err.isOk()) {
                    err = parseParamValue(it->type, text, value);
                }
            }

            if (err.isOk()) {
                setArgument(config.engine_args, it->dest, value);
            }
        }

        if (!err.isOk()) {
            if (err.detail.empty()) {
                err.detail = "while parsing " + arg;
            }
            return err;
        }
    }

    return ErrorInfo::ok();
}

std::string CliParser::usage(const std::string& program) const {
    std::ostringstream oss;
    oss << "usage: " << program << " [options] media_file [media_file ...]\n\n";
    oss << "positional arguments:\n";
    oss << "  media_file                    The path of the media file or a list of files separated by space\n\n";
    oss << "options:\n";
    oss << "  -h,        --help             show this help message and exit\n";
    oss << "             --version          show program's version number and exit\n";
    oss << "  -m MODEL,  --model MODEL      [tiny   ] path to the ggml model, or just the model name\n";
    oss << "             --processors N     [1      ] number of processors to use during computation\n";
    oss << "  -otxt,     --output-txt       [false  ] output result in a text file\n";
    oss << "  -ovtt,     --output-vtt       [false  ] output result in a vtt file\n";
    oss << "  -osrt,     --output-srt       [false  ] output result in a srt file\n";
    oss << "  -ocsv,     --output-csv       [false  ] output result in a csv file\n";
    oss << "\nengine options:\n";
    oss << "  [BOOL] options take an optional true/false/1/0/yes/no/on/off value.\n";
    oss << "  Write --flag=value when the next argument is a media file named like one,\n";
    oss << "  e.g. --translate=true 1\n\n";

    for (const auto& option : engine_options_) {
        const std::string spelled = option.flag + " " + metavarFor(option.type);
        const std::string def = option.default_value
            ? paramValueToString(*option.default_value) : std::string("-");
        oss << "  " << std::left << std::setw(30) << spelled
            << "[" << std::setw(7) << def << "] " << option.help << "\n";
    }

    return oss.str();
}

// =============================================================================
// CliConfigValidator
// =============================================================================

ErrorInfo CliConfigValidator::validate(const CliConfig& config) {
    if (config.show_help || config.show_version) {
        return ErrorInfo::ok();
    }

    if (config.media_files.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "the following arguments are required: media_file");
    }

    if (config.model.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Model must not be empty");
    }

    if (config.processors < 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Processors must be >= 0 (0 = engine default)");
    }

    return ErrorInfo::ok();
}

}  // namespace scribe
