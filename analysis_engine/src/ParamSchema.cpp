#include "ParamSchema.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char* paramTypeName(ParamType type) {
    switch (type) {
        case ParamType::Float:      return "float";
        case ParamType::Int:        return "int";
        case ParamType::Bool:       return "bool";
        case ParamType::String:     return "str";
        case ParamType::Enum:       return "enum";
        case ParamType::StringList: return "list_str";
    }
    return "float";
}

// ============================================================================
// ParamSpec factories
// ============================================================================

ParamSpec ParamSpec::makeFloat(const std::string& key, const std::string& label,
                               double def, double min, double max, double step,
                               const std::string& description,
                               std::vector<std::string> examples) {
    ParamSpec s;
    s.key = key;
    s.label = label;
    s.type = ParamType::Float;
    s.defaultValue = def;
    s.min = min;
    s.max = max;
    s.step = step;
    s.description = description;
    s.examples = std::move(examples);
    return s;
}

ParamSpec ParamSpec::makeInt(const std::string& key, const std::string& label,
                             int def, int min, int max, int step,
                             const std::string& description,
                             std::vector<std::string> examples) {
    ParamSpec s;
    s.key = key;
    s.label = label;
    s.type = ParamType::Int;
    s.defaultValue = def;
    s.min = min;
    s.max = max;
    s.step = step;
    s.description = description;
    s.examples = std::move(examples);
    return s;
}

ParamSpec ParamSpec::makeBool(const std::string& key, const std::string& label,
                              bool def, const std::string& description,
                              std::vector<std::string> examples) {
    ParamSpec s;
    s.key = key;
    s.label = label;
    s.type = ParamType::Bool;
    s.defaultValue = def;
    s.description = description;
    s.examples = std::move(examples);
    return s;
}

ParamSpec ParamSpec::makeEnum(const std::string& key, const std::string& label,
                              const std::string& def, std::vector<std::string> choices,
                              const std::string& description,
                              std::vector<std::string> examples) {
    ParamSpec s;
    s.key = key;
    s.label = label;
    s.type = ParamType::Enum;
    s.defaultValue = def;
    s.choices = std::move(choices);
    s.description = description;
    s.examples = std::move(examples);
    return s;
}

ParamSpec ParamSpec::makeString(const std::string& key, const std::string& label,
                                const std::string& def, const std::string& description,
                                std::vector<std::string> examples) {
    ParamSpec s;
    s.key = key;
    s.label = label;
    s.type = ParamType::String;
    s.defaultValue = def;
    s.description = description;
    s.examples = std::move(examples);
    return s;
}

ParamMap schemaDefaults(const Schema& schema) {
    ParamMap out;
    for (const auto& spec : schema) {
        out[spec.key] = spec.defaultValue;
    }
    return out;
}

void backfillDefaults(ParamMap& params, const Schema& schema) {
    for (const auto& spec : schema) {
        if (params.find(spec.key) == params.end()) {
            params[spec.key] = spec.defaultValue;
        }
    }
}

// ============================================================================
// Typed accessors
// ============================================================================

// Numeric view of a value. Strings are parsed; lists are not numeric.
static std::optional<double> numericValue(const ParamValue& v) {
    if (auto d = std::get_if<double>(&v)) return *d;
    if (auto i = std::get_if<int>(&v)) return static_cast<double>(*i);
    if (auto b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    if (auto s = std::get_if<std::string>(&v)) {
        try {
            size_t used = 0;
            double d = std::stod(*s, &used);
            if (used > 0) return d;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double paramAsDouble(const ParamMap& params, const std::string& key, double def) {
    auto it = params.find(key);
    if (it == params.end()) return def;
    auto v = numericValue(it->second);
    if (!v || !std::isfinite(*v)) return def;
    return *v;
}

int paramAsInt(const ParamMap& params, const std::string& key, int def) {
    auto it = params.find(key);
    if (it == params.end()) return def;
    if (auto i = std::get_if<int>(&it->second)) return *i;
    auto v = numericValue(it->second);
    if (!v || !std::isfinite(*v)) return def;
    double t = std::trunc(*v);
    if (t < static_cast<double>(std::numeric_limits<int>::min()) ||
        t > static_cast<double>(std::numeric_limits<int>::max())) {
        return def;
    }
    return static_cast<int>(t);
}

bool paramAsBool(const ParamMap& params, const std::string& key, bool def) {
    auto it = params.find(key);
    if (it == params.end()) return def;
    if (auto b = std::get_if<bool>(&it->second)) return *b;
    if (auto s = std::get_if<std::string>(&it->second)) {
        if (*s == "true" || *s == "True" || *s == "1") return true;
        if (*s == "false" || *s == "False" || *s == "0" || s->empty()) return false;
        return def;
    }
    auto v = numericValue(it->second);
    if (!v) return def;
    return *v != 0.0;
}

std::string paramAsString(const ParamMap& params, const std::string& key, const std::string& def) {
    auto it = params.find(key);
    if (it == params.end()) return def;
    if (auto s = std::get_if<std::string>(&it->second)) return *s;
    return paramValueToString(it->second);
}

std::vector<std::string> paramAsStringList(const ParamMap& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) return {};
    if (auto l = std::get_if<std::vector<std::string>>(&it->second)) return *l;

    // Comma-separated string form: "aa, ad, da"
    std::vector<std::string> out;
    if (auto s = std::get_if<std::string>(&it->second)) {
        std::stringstream ss(*s);
        std::string item;
        while (std::getline(ss, item, ',')) {
            size_t b = item.find_first_not_of(" \t");
            size_t e = item.find_last_not_of(" \t");
            if (b == std::string::npos) continue;
            out.push_back(item.substr(b, e - b + 1));
        }
    }
    return out;
}

std::string paramValueToString(const ParamValue& value) {
    struct Visitor {
        std::string operator()(double d) const {
            std::ostringstream os;
            os << d;
            return os.str();
        }
        std::string operator()(int i) const { return std::to_string(i); }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(const std::vector<std::string>& l) const {
            std::string out;
            for (size_t i = 0; i < l.size(); ++i) {
                if (i) out += ",";
                out += l[i];
            }
            return out;
        }
    };
    return std::visit(Visitor{}, value);
}

// ============================================================================
// JSON conversion
// ============================================================================

json paramValueToJson(const ParamValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

std::optional<ParamValue> paramValueFromJson(const json& j) {
    if (j.is_boolean())         return ParamValue(j.get<bool>());
    if (j.is_number_integer()) {
        // Integers wider than int are kept as doubles; int readers range-check them.
        if (j.is_number_unsigned()) {
            auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                return ParamValue(static_cast<int>(u));
            return ParamValue(static_cast<double>(u));
        }
        auto i = j.get<std::int64_t>();
        if (i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max())
            return ParamValue(static_cast<int>(i));
        return ParamValue(static_cast<double>(i));
    }
    if (j.is_number())          return ParamValue(j.get<double>());
    if (j.is_string())          return ParamValue(j.get<std::string>());
    if (j.is_array()) {
        std::vector<std::string> list;
        for (const auto& item : j) {
            if (!item.is_string()) return std::nullopt;
            list.push_back(item.get<std::string>());
        }
        return ParamValue(std::move(list));
    }
    return std::nullopt;
}

json paramMapToJson(const ParamMap& params) {
    json out = json::object();
    for (const auto& [key, value] : params) {
        out[key] = paramValueToJson(value);
    }
    return out;
}

ParamMap paramMapFromJson(const json& j) {
    ParamMap out;
    if (!j.is_object()) return out;
    for (const auto& [key, item] : j.items()) {
        auto v = paramValueFromJson(item);
        if (v) {
            out[key] = *v;
        } else {
            std::cerr << "[ParamSchema] WARNING: dropping unsupported value for key '"
                      << key << "'" << std::endl;
        }
    }
    return out;
}

json schemaToJson(const Schema& schema) {
    json out = json::array();
    for (const auto& s : schema) {
        json e;
        e["key"] = s.key;
        e["label"] = s.label;
        e["type"] = paramTypeName(s.type);
        e["default"] = paramValueToJson(s.defaultValue);
        e["min"] = s.min ? json(*s.min) : json(nullptr);
        e["max"] = s.max ? json(*s.max) : json(nullptr);
        e["step"] = s.step ? json(*s.step) : json(nullptr);
        e["choices"] = s.choices.empty() ? json(nullptr) : json(s.choices);
        e["hint"] = s.hint;
        e["description"] = s.effectiveDescription();
        e["examples"] = s.examples.empty() ? json(nullptr) : json(s.examples);
        out.push_back(std::move(e));
    }
    return out;
}
