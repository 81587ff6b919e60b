// ParamSchema.hpp - Tunable parameter descriptions and values
//
// Every signal component and every transform plugin publishes a Schema: an
// ordered list of ParamSpec entries describing the knobs it understands.
// The parameter forms (outside this repository) build their widgets from a
// Schema; the engine uses it to backfill missing keys with defaults.
//
// Parameter VALUES travel as a ParamMap (key → ParamValue). The value type
// is a closed variant: float, int, bool, string, or list-of-string. Readers
// use the paramAs*() accessors, which coerce between numeric types and fall
// back to a default when the key is missing or not convertible.
//
// NOTE: never build a ParamValue from a string literal directly; a
// `const char*` converts to bool before std::string. Wrap it:
//   ParamValue v = std::string("morl");

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

using ParamValue = std::variant<double, int, bool, std::string, std::vector<std::string>>;
using ParamMap   = std::map<std::string, ParamValue>;

enum class ParamType {
    Float,
    Int,
    Bool,
    String,
    Enum,
    StringList
};

const char* paramTypeName(ParamType type);

// ─────────────────────────────────────────────────────────────────────────────
// ParamSpec - one tunable parameter
// ─────────────────────────────────────────────────────────────────────────────

struct ParamSpec {
    std::string key;
    std::string label;
    ParamType   type = ParamType::Float;
    ParamValue  defaultValue = 0.0;

    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> step;
    std::vector<std::string> choices;   // Enum only

    std::string hint;                   // legacy short text, backfills description
    std::string description;
    std::vector<std::string> examples;

    static ParamSpec makeFloat(const std::string& key, const std::string& label,
                               double def, double min, double max, double step,
                               const std::string& description,
                               std::vector<std::string> examples = {});

    static ParamSpec makeInt(const std::string& key, const std::string& label,
                             int def, int min, int max, int step,
                             const std::string& description,
                             std::vector<std::string> examples = {});

    static ParamSpec makeBool(const std::string& key, const std::string& label,
                              bool def, const std::string& description,
                              std::vector<std::string> examples = {});

    static ParamSpec makeEnum(const std::string& key, const std::string& label,
                              const std::string& def, std::vector<std::string> choices,
                              const std::string& description,
                              std::vector<std::string> examples = {});

    static ParamSpec makeString(const std::string& key, const std::string& label,
                                const std::string& def, const std::string& description,
                                std::vector<std::string> examples = {});

    /// Description shown to the operator; falls back to the legacy hint.
    const std::string& effectiveDescription() const {
        return description.empty() ? hint : description;
    }
};

using Schema = std::vector<ParamSpec>;

/// Map of every key in the schema to its default value.
ParamMap schemaDefaults(const Schema& schema);

/// Fill keys missing from `params` with schema defaults. Existing keys
/// (including ones the schema doesn't know about) are left untouched.
void backfillDefaults(ParamMap& params, const Schema& schema);

// ─────────────────────────────────────────────────────────────────────────────
// Typed accessors
// ─────────────────────────────────────────────────────────────────────────────

double      paramAsDouble(const ParamMap& params, const std::string& key, double def);
int         paramAsInt(const ParamMap& params, const std::string& key, int def);
bool        paramAsBool(const ParamMap& params, const std::string& key, bool def);
std::string paramAsString(const ParamMap& params, const std::string& key, const std::string& def);
std::vector<std::string> paramAsStringList(const ParamMap& params, const std::string& key);

/// Render a value for logs and CSV headers.
std::string paramValueToString(const ParamValue& value);

// ─────────────────────────────────────────────────────────────────────────────
// JSON conversion (saved configurations, schema export)
// ─────────────────────────────────────────────────────────────────────────────

nlohmann::json paramValueToJson(const ParamValue& value);
std::optional<ParamValue> paramValueFromJson(const nlohmann::json& j);

nlohmann::json paramMapToJson(const ParamMap& params);
/// Non-object input yields an empty map; unconvertible entries are dropped.
ParamMap paramMapFromJson(const nlohmann::json& j);

nlohmann::json schemaToJson(const Schema& schema);
