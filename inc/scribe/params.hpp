#ifndef SCRIBE_PARAMS_HPP
#define SCRIBE_PARAMS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// Parameter Values (参数值)
// =============================================================================

enum class ParamType {
    BOOL,
    INT,
    FLOAT,
    STRING,
    GROUP,          // nested group of typed fields
};

const char* paramTypeToString(ParamType type);

using ParamValue = std::variant<bool, int32_t, float, std::string>;

std::string paramValueToString(const ParamValue& value);

/// @brief Parse command-line text into a value of the given type
/// @param type target type (GROUP is rejected)
/// @param text raw text
/// @param value [out] parsed value
/// @return INVALID_ARGUMENT if the text does not parse
ErrorInfo parseParamValue(ParamType type, const std::string& text, ParamValue& value);

// Lenient accessors: numeric values convert between int and float, strings
// are never converted.
bool paramAsBool(const ParamValue& value);
int32_t paramAsInt(const ParamValue& value);
float paramAsFloat(const ParamValue& value);
std::string paramAsString(const ParamValue& value);

// =============================================================================
// Param Schema (参数表)
// =============================================================================

struct ParamField {
    std::string name;
    ParamType type;
    ParamValue default_value;
};

struct ParamDescriptor {
    std::string name;                           // canonical name
    ParamType type;
    std::optional<ParamValue> default_value;    // nullopt: engine decides
    std::string description;
    std::vector<ParamField> fields;             // GROUP only
};

class ParamSchema {
public:
    ParamSchema() = default;
    explicit ParamSchema(std::vector<ParamDescriptor> params);

    /// @brief Built-in schema mirroring whisper_full_params
    static const ParamSchema& whisper();

    bool contains(const std::string& name) const;
    const ParamDescriptor* find(const std::string& name) const;
    const ParamField* findField(const std::string& group, const std::string& field) const;

    const std::vector<ParamDescriptor>& params() const { return params_; }

private:
    std::vector<ParamDescriptor> params_;
    std::map<std::string, size_t> index_;
};

// =============================================================================
// Param Mapping (参数名映射)
// =============================================================================
//
// Canonical paths are either a plain schema name ("n_threads") or a dotted
// "group.field" path ("beam_search.beam_size"). External names are the flat
// names exposed on the command line ("threads", "beam_size").
//

struct ParamPath {
    std::string group;      // or the plain name
    std::string field;      // empty for plain names

    bool isNested() const { return !field.empty(); }
    std::string toString() const { return isNested() ? group + "." + field : group; }

    /// @brief Split on the first '.'
    static ParamPath parse(const std::string& path);
};

class ParamMapping {
public:
    using Entry = std::pair<std::string, std::string>;  // canonical -> external

    ParamMapping() = default;
    explicit ParamMapping(std::vector<Entry> entries);

    /// @brief Built-in mapping for the whisper schema
    static const ParamMapping& whisper();

    std::optional<std::string> externalName(const std::string& canonical) const;
    std::optional<std::string> canonicalPath(const std::string& external) const;

    bool isMapped(const std::string& canonical) const { return forward_.count(canonical) > 0; }

    /// @brief Check the mapping invariants
    /// @note Every external name maps to one canonical path and dotted paths
    ///       have exactly two non-empty segments.
    ErrorInfo validate() const;

    /// @brief validate() plus: every canonical path exists in the schema
    ErrorInfo validate(const ParamSchema& schema) const;

    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
    std::map<std::string, std::string> forward_;
    std::map<std::string, std::string> inverse_;
    std::vector<std::string> duplicates_;
};

// =============================================================================
// Resolved Params (解析后的参数)
// =============================================================================

using ParamGroup = std::map<std::string, ParamValue>;

struct ResolvedParams {
    std::map<std::string, ParamValue> values;
    std::map<std::string, ParamGroup> groups;

    bool empty() const { return values.empty() && groups.empty(); }

    const ParamValue* find(const std::string& name) const;
    const ParamValue* find(const std::string& group, const std::string& field) const;

    void set(const std::string& name, ParamValue value) {
        values[name] = std::move(value);
    }

    void set(const std::string& group, const std::string& field, ParamValue value) {
        groups[group][field] = std::move(value);
    }

    /// @brief Multi-line dump for the startup log
    std::string toString() const;

    bool operator==(const ResolvedParams& other) const {
        return values == other.values && groups == other.groups;
    }
    bool operator!=(const ResolvedParams& other) const { return !(*this == other); }
};

// =============================================================================
// Param Resolver
// =============================================================================

struct Argument {
    std::string name;
    std::optional<ParamValue> value;    // nullopt: option absent, no default
};

using ArgumentSet = std::vector<Argument>;

class ParamResolver {
public:
    /// @brief Translate flat arguments into the nested engine parameters
    ///
    /// Schema names win over mapped names. Mapped dotted paths land in
    /// groups, mapped plain paths in values. Unknown names and mapped
    /// arguments without a value are skipped. Later arguments overwrite
    /// earlier ones on the same target.
    static ResolvedParams resolve(const ArgumentSet& args,
        const ParamSchema& schema = ParamSchema::whisper(),
        const ParamMapping& mapping = ParamMapping::whisper());
};

}  // namespace scribe

#endif  // SCRIBE_PARAMS_HPP
