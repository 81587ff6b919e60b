#include "JSONLoader.hpp"
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Transform keys from the old scale-based CWT mode; no longer meaningful.
static const char* const kObsoleteTransformKeys[] = {
    "use_legacy", "scales_min", "scales_max", "n_scales"
};

// First numeric value found under any of `keys`.
static std::optional<double> numberAt(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it == obj.end()) continue;
        if (it->is_number()) return it->get<double>();
        std::cerr << "[JSONLoader] WARNING: '" << key << "' is not a number, ignoring\n";
    }
    return std::nullopt;
}

// First object found under any of `keys`.
static const json* objectAt(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_object()) return &*it;
    }
    return nullptr;
}

static PresetGlobals parseGlobals(const json& g) {
    PresetGlobals out;

    if (auto v = numberAt(g, {"sample_rate", "fs"})) {
        if (*v > 0.0) out.sampleRate = *v;
        else std::cerr << "[JSONLoader] WARNING: non-positive sample rate, using default\n";
    }
    if (auto v = numberAt(g, {"chunk_length", "chunk_size"})) {
        if (*v < 1.0)
            std::cerr << "[JSONLoader] WARNING: chunk length < 1, using default\n";
        else if (*v > static_cast<double>(std::numeric_limits<int>::max()))
            std::cerr << "[JSONLoader] WARNING: chunk length " << *v << " out of range, using default\n";
        else
            out.chunkLength = static_cast<int>(*v);
    }
    if (auto v = numberAt(g, {"window_seconds", "view_window_sec"})) {
        if (*v > 0.0) out.windowSeconds = *v;
    }
    if (auto v = numberAt(g, {"frame_rate", "scalogram_fps"})) {
        if (*v > 0.0) out.frameRate = *v;
    }
    if (auto v = numberAt(g, {"amplitude_clip"})) {
        out.amplitudeClip = std::max(0.0, *v);
    }
    return out;
}

static std::vector<ComponentSnapshot> parseComponents(const json& arr) {
    std::vector<ComponentSnapshot> out;
    int index = 0;
    for (const auto& c : arr) {
        ++index;
        if (!c.is_object()) {
            std::cerr << "[JSONLoader] WARNING: component #" << index << " is not an object, skipping\n";
            continue;
        }

        const json* kindField = nullptr;
        for (const char* key : {"kind", "type"}) {
            auto it = c.find(key);
            if (it != c.end() && it->is_string()) {
                kindField = &*it;
                break;
            }
        }
        if (!kindField) {
            std::cerr << "[JSONLoader] WARNING: component #" << index << " has no kind, skipping\n";
            continue;
        }

        ComponentSnapshot snap;
        snap.kind = kindField->get<std::string>();
        auto name = c.find("name");
        if (name != c.end() && name->is_string()) snap.name = name->get<std::string>();
        auto enabled = c.find("enabled");
        snap.enabled = (enabled != c.end() && enabled->is_boolean()) ? enabled->get<bool>() : true;
        if (const json* params = objectAt(c, {"params"})) {
            snap.params = paramMapFromJson(*params);
        }
        out.push_back(std::move(snap));
    }
    return out;
}

// ============================================================================
// Load
// ============================================================================

PresetData JSONLoader::parsePreset(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid preset JSON: ") + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("Preset root is not a JSON object");

    PresetData d;

    if (const json* g = objectAt(j, {"globals"})) {
        d.globals = parseGlobals(*g);
    }

    if (const json* t = objectAt(j, {"transform", "wavelet"})) {
        auto pid = t->find("plugin_id");
        if (pid != t->end() && pid->is_string() && !pid->get<std::string>().empty()) {
            d.pluginId = pid->get<std::string>();
        }
        if (const json* params = objectAt(*t, {"params"})) {
            d.transformParams = paramMapFromJson(*params);
        }
        for (const char* key : kObsoleteTransformKeys) {
            d.transformParams.erase(key);
        }
    }

    auto comps = j.find("components");
    if (comps != j.end()) {
        if (comps->is_array()) {
            d.components = parseComponents(*comps);
        } else {
            std::cerr << "[JSONLoader] WARNING: 'components' is not an array, ignoring\n";
        }
    }

    return d;
}

PresetData JSONLoader::loadPreset(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot open preset JSON: " + path);

    std::stringstream buffer;
    buffer << f.rdbuf();
    PresetData d = parsePreset(buffer.str());

    std::cout << "[JSONLoader] Loaded preset " << path << ": "
              << d.components.size() << " component(s), plugin " << d.pluginId << "\n";
    return d;
}

// ============================================================================
// Save
// ============================================================================

std::string JSONLoader::presetToString(const PresetData& data) {
    json j;
    j["globals"] = {
        {"sample_rate", data.globals.sampleRate},
        {"chunk_length", data.globals.chunkLength},
        {"window_seconds", data.globals.windowSeconds},
        {"frame_rate", data.globals.frameRate},
        {"amplitude_clip", data.globals.amplitudeClip},
    };
    j["transform"] = {
        {"plugin_id", data.pluginId},
        {"params", paramMapToJson(data.transformParams)},
    };

    json comps = json::array();
    for (const auto& c : data.components) {
        json e;
        e["kind"] = c.kind;
        if (!c.name.empty()) e["name"] = c.name;
        e["enabled"] = c.enabled;
        e["params"] = paramMapToJson(c.params);
        comps.push_back(std::move(e));
    }
    j["components"] = std::move(comps);
    return j.dump(2);
}

void JSONLoader::savePreset(const std::string& path, const PresetData& data) {
    std::ofstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot write preset JSON: " + path);
    f << presetToString(data) << "\n";
    if (!f.good()) throw std::runtime_error("Failed writing preset JSON: " + path);
    std::cout << "[JSONLoader] Saved preset " << path << "\n";
}

PresetData JSONLoader::defaultPreset() {
    PresetData d;
    d.components = {
        {"noise", "", true, {{"sigma", 0.15}}},
        {"sine", "", true, {{"frequency", 6.0}, {"amplitude", 1.0}}},
        {"sine", "", true, {{"frequency", 30.0}, {"amplitude", 0.4}}},
    };
    return d;
}
