// PluginRegistry.hpp - Transform plugin table
//
// Maps plugin ids to transform implementations. reloadAll() rebuilds the
// whole table: built-in transforms first, then every shared module found
// in the plugin directory. The new table replaces the old one in a single
// swap, so a reader never sees a half-loaded registry.
//
// EXTERNAL MODULES:
// - One file per plugin: <dir>/<stem>.so (or .dylib). Files whose stem
//   starts with '_' are ignored.
// - The module is looked up as "plugin:<stem>". If its metadata declares a
//   different id, the plugin answers to BOTH ids.
// - Later modules win. Claiming another plugin's own id removes that plugin
//   and all of its aliases; claiming only an alias key re-points that key.
// - A module is accepted only if it exports the three entry points from
//   TransformPlugin.hpp, reports the current ABI version, returns a
//   non-null instance with a non-empty id and name, and none of those
//   calls throws (of any type).
// - A module that fails any check is logged, recorded in failures(), and
//   skipped. Loading continues with the next file.
//
// LIFETIME:
// - PluginInfo::capability is a shared_ptr whose deleter calls the
//   module's destroy function and then drops the module handle. A plugin
//   handed out by get() stays valid across reloadAll().

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "TransformPlugin.hpp"

struct PluginInfo {
    std::string    id;            // key this entry is registered under
    PluginMetadata metadata;
    std::shared_ptr<const ITransformPlugin> capability;
    std::string    origin;        // "builtin" or the module path
};

struct PluginLoadFailure {
    std::string path;
    std::string reason;
};

class PluginRegistry {
public:
    explicit PluginRegistry(std::string pluginDirectory = "");

    void setPluginDirectory(const std::string& dir);
    std::string pluginDirectory() const;

    /// Rebuild the table. Returns the number of distinct plugins loaded.
    size_t reloadAll();

    /// Distinct plugins in load order (an aliased plugin appears once).
    std::vector<PluginInfo> list() const;

    /// Lookup by either the discovery id or the declared id.
    std::optional<PluginInfo> get(const std::string& id) const;

    std::vector<std::string> ids() const;

    /// One object per distinct plugin: id, aliases, metadata, origin and
    /// the parameter schema (see schemaToJson()).
    nlohmann::json catalogJson() const;

    /// Modules rejected by the last reloadAll().
    std::vector<PluginLoadFailure> failures() const;

    /// Load and validate a single module. On failure returns nullopt and
    /// fills `error`.
    static std::optional<PluginInfo> loadModule(const std::filesystem::path& path,
                                                std::string& error);

private:
    mutable std::mutex mMutex;
    std::string mPluginDir;
    std::map<std::string, PluginInfo> mById;
    std::vector<PluginInfo> mOrdered;
    std::vector<PluginLoadFailure> mFailures;
};
