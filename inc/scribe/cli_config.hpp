#ifndef SCRIBE_CLI_CONFIG_HPP
#define SCRIBE_CLI_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

#include "output_writers.hpp"
#include "params.hpp"
#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// CLI Configuration (命令行配置)
// =============================================================================

struct CliConfig {
    std::vector<std::string> media_files;   // positional, one or more

    std::string model = "tiny";             // model file path or model name
    int processors = 1;                     // 0 = engine default

    OutputOptions outputs;

    // One entry per schema-derived option, defaults filled in
    ArgumentSet engine_args;

    bool show_help = false;
    bool show_version = false;

    // Options that matched nothing, reported and otherwise ignored
    std::vector<std::string> ignored_args;
};

/// @brief A command-line flag derived from the parameter tables
struct CliOption {
    std::string flag;                           // "--best-of"
    std::string dest;                           // "best_of", the argument name
    ParamType type;
    std::optional<ParamValue> default_value;
    std::string help;
};

// =============================================================================
// CLI Parser
// =============================================================================

class CliParser {
public:
    explicit CliParser(const ParamSchema& schema = ParamSchema::whisper(),
        const ParamMapping& mapping = ParamMapping::whisper());

    /// @brief Parse argv (argv[0] is the program name)
    ErrorInfo parse(int argc, const char* const* argv, CliConfig& config) const;

    /// @brief Parse arguments without the program name
    ErrorInfo parse(const std::vector<std::string>& args, CliConfig& config) const;

    std::string usage(const std::string& program) const;

    const std::vector<CliOption>& engineOptions() const { return engine_options_; }

    /// @brief One flag per schema/mapping entry
    ///
    /// Group fields get a flag only when mapped, flat entries use the mapped
    /// name when there is one and the canonical name otherwise. Underscores
    /// become hyphens.
    static std::vector<CliOption> deriveOptions(const ParamSchema& schema,
        const ParamMapping& mapping);

private:
    std::vector<CliOption> engine_options_;

    // Exact match, then unique prefix of a long flag
    ErrorInfo matchLongFlag(const std::string& flag, std::string& matched) const;
};

// =============================================================================
// Config Validator (配置验证器)
// =============================================================================

class CliConfigValidator {
public:
    static ErrorInfo validate(const CliConfig& config);
};

}  // namespace scribe

#endif  // SCRIBE_CLI_CONFIG_HPP
