#include "PluginRegistry.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

#include <dlfcn.h>
#include <nlohmann/json.hpp>

#include "transforms/BuiltinTransforms.hpp"

namespace fs = std::filesystem;

PluginRegistry::PluginRegistry(std::string pluginDirectory)
    : mPluginDir(std::move(pluginDirectory)) {}

void PluginRegistry::setPluginDirectory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mMutex);
    mPluginDir = dir;
}

std::string PluginRegistry::pluginDirectory() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPluginDir;
}

// ============================================================================
// Module loading
// ============================================================================

std::optional<PluginInfo> PluginRegistry::loadModule(const fs::path& path, std::string& error) {
    dlerror();
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* msg = dlerror();
        error = msg ? msg : "dlopen failed";
        return std::nullopt;
    }
    std::shared_ptr<void> library(handle, [](void* h) { dlclose(h); });

    auto abiVersion = reinterpret_cast<PluginAbiVersionFn>(dlsym(handle, kPluginAbiVersionSymbol));
    auto create     = reinterpret_cast<PluginCreateFn>(dlsym(handle, kPluginCreateSymbol));
    auto destroy    = reinterpret_cast<PluginDestroyFn>(dlsym(handle, kPluginDestroySymbol));
    if (!abiVersion || !create || !destroy) {
        error = "missing plugin entry points";
        return std::nullopt;
    }

    // Module code may throw anything.
    std::shared_ptr<const ITransformPlugin> capability;
    PluginInfo info;
    try {
        const int version = abiVersion();
        if (version != WAVELETSCOPE_PLUGIN_ABI_VERSION) {
            error = "ABI version " + std::to_string(version) + " (expected "
                  + std::to_string(WAVELETSCOPE_PLUGIN_ABI_VERSION) + ")";
            return std::nullopt;
        }

        ITransformPlugin* raw = create();
        if (!raw) {
            error = "create function returned null";
            return std::nullopt;
        }
        // Deleter keeps the library mapped until destroy() has run.
        capability.reset(raw, [library, destroy](const ITransformPlugin* p) {
            destroy(const_cast<ITransformPlugin*>(p));
        });

        info.metadata = capability->metadata();
        capability->describeParameters();
    } catch (const std::exception& e) {
        error = std::string("plugin threw during validation: ") + e.what();
        return std::nullopt;
    } catch (...) {
        error = "plugin threw during validation: unknown exception";
        return std::nullopt;
    }

    if (info.metadata.id.empty() || info.metadata.name.empty()) {
        error = "metadata is missing id or name";
        return std::nullopt;
    }

    info.id = "plugin:" + path.stem().string();
    info.capability = std::move(capability);
    info.origin = path.string();
    return info;
}

// ============================================================================
// Registry
// ============================================================================

// True when `entry` is the plugin's own id rather than a declared-id alias.
static bool isPrimaryKey(const std::vector<PluginInfo>& ordered, const PluginInfo& entry) {
    return std::any_of(ordered.begin(), ordered.end(), [&](const PluginInfo& p) {
        return p.id == entry.id && p.capability == entry.capability;
    });
}

// Remove every key and list entry that refers to `capability`.
static void dropPlugin(std::map<std::string, PluginInfo>& byId,
                       std::vector<PluginInfo>& ordered,
                       const std::shared_ptr<const ITransformPlugin>& capability) {
    const auto victim = capability;
    for (auto it = byId.begin(); it != byId.end();) {
        if (it->second.capability == victim) it = byId.erase(it);
        else ++it;
    }
    ordered.erase(std::remove_if(ordered.begin(), ordered.end(),
                                 [&](const PluginInfo& p) { return p.capability == victim; }),
                  ordered.end());
}

size_t PluginRegistry::reloadAll() {
    const std::string dir = pluginDirectory();

    std::map<std::string, PluginInfo> byId;
    std::vector<PluginInfo> ordered;
    std::vector<PluginLoadFailure> failures;

    // ── Built-ins ────────────────────────────────────────────────────────
    for (auto& plugin : makeBuiltinTransforms()) {
        PluginInfo info;
        info.metadata = plugin->metadata();
        info.id = info.metadata.id;
        info.capability = std::move(plugin);
        info.origin = "builtin";
        byId[info.id] = info;
        ordered.push_back(std::move(info));
    }

    // ── External modules ─────────────────────────────────────────────────
    std::vector<fs::path> candidates;
    std::error_code ec;
    if (!dir.empty() && fs::is_directory(dir, ec)) {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file(ec)) continue;
            const fs::path& p = entry.path();
            const std::string ext = p.extension().string();
            if (ext != ".so" && ext != ".dylib") continue;
            if (p.stem().string().rfind('_', 0) == 0) continue;
            candidates.push_back(p);
        }
        if (ec) {
            std::cerr << "[PluginRegistry] WARNING: error scanning " << dir << ": "
                      << ec.message() << std::endl;
        }
        std::sort(candidates.begin(), candidates.end());
    } else if (!dir.empty()) {
        std::cout << "[PluginRegistry] Plugin directory " << dir
                  << " not found; built-ins only." << std::endl;
    }

    for (const auto& path : candidates) {
        std::string error;
        auto loaded = loadModule(path, error);
        if (!loaded) {
            std::cerr << "[PluginRegistry] ERROR: failed to load " << path.string()
                      << ": " << error << std::endl;
            failures.push_back({path.string(), error});
            continue;
        }

        PluginInfo info = std::move(*loaded);
        auto previous = byId.find(info.id);
        if (previous != byId.end()) {
            std::cerr << "[PluginRegistry] WARNING: " << path.string()
                      << " replaces existing plugin " << info.id << std::endl;
            if (isPrimaryKey(ordered, previous->second)) {
                dropPlugin(byId, ordered, previous->second.capability);
            }
        }
        byId[info.id] = info;

        const std::string& declared = info.metadata.id;
        if (declared != info.id) {
            auto taken = byId.find(declared);
            if (taken != byId.end()) {
                std::cerr << "[PluginRegistry] WARNING: declared id " << declared
                          << " of " << path.string() << " replaces " << taken->second.origin
                          << std::endl;
                if (isPrimaryKey(ordered, taken->second)) {
                    dropPlugin(byId, ordered, taken->second.capability);
                }
            }
            PluginInfo alias = info;
            alias.id = declared;
            byId[declared] = std::move(alias);
        }
        ordered.push_back(std::move(info));
    }

    const size_t count = ordered.size();
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mById = std::move(byId);
        mOrdered = std::move(ordered);
        mFailures = std::move(failures);
    }

    std::cout << "[PluginRegistry] Loaded " << count << " plugin(s)";
    if (!candidates.empty()) {
        std::cout << " (" << candidates.size() << " candidate module(s) in " << dir << ")";
    }
    std::cout << "." << std::endl;
    return count;
}

std::vector<PluginInfo> PluginRegistry::list() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mOrdered;
}

std::optional<PluginInfo> PluginRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mById.find(id);
    if (it == mById.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> PluginRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> out;
    out.reserve(mById.size());
    for (const auto& [id, _] : mById) out.push_back(id);
    return out;
}

nlohmann::json PluginRegistry::catalogJson() const {
    std::vector<PluginInfo> ordered;
    std::map<std::string, PluginInfo> byId;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        ordered = mOrdered;
        byId = mById;
    }

    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : ordered) {
        nlohmann::json aliases = nlohmann::json::array();
        for (const auto& [key, entry] : byId) {
            if (key != p.id && entry.capability == p.capability) aliases.push_back(key);
        }
        nlohmann::json e;
        e["id"] = p.id;
        e["aliases"] = std::move(aliases);
        e["name"] = p.metadata.name;
        e["kind"] = p.metadata.kind;
        e["version"] = p.metadata.version;
        e["description"] = p.metadata.description;
        e["origin"] = p.origin;
        e["params"] = schemaToJson(p.capability->describeParameters());
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<PluginLoadFailure> PluginRegistry::failures() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mFailures;
}
