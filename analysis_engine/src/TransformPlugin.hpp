// TransformPlugin.hpp - Contract between the analysis pipeline and a transform
//
// A transform turns a window of samples into a TransformResult. Built-in
// transforms implement ITransformPlugin directly and are registered in
// BuiltinTransforms.cpp. External transforms are shared modules that export
// the three C entry points below; PluginRegistry dlopen()s them from the
// plugin directory and validates them before registering.
//
// WRITING AN EXTERNAL PLUGIN:
//
//   class MyTransform : public ITransformPlugin { ... };
//   WAVELETSCOPE_EXPORT_TRANSFORM_PLUGIN(MyTransform)
//
// and build it as a MODULE library with no "lib" prefix. The file stem is
// the lookup id ("plugin:<stem>"); if metadata().id differs, the registry
// answers to both.
//
// RULES:
// - transform() is const and must be callable from the analysis thread
//   while the main thread reads metadata(). Keep per-call state local.
// - transform() may throw std::exception on bad parameters; the worker
//   reports it and carries on.
// - Windows shorter than kMinWindowSamples must give the 1-row zero result
//   (TransformUtils::degenerateResult) rather than throwing.

#pragma once

#include <string>
#include <vector>

#include "ParamSchema.hpp"
#include "TransformResult.hpp"

#define WAVELETSCOPE_PLUGIN_ABI_VERSION 1

#if defined(__GNUC__) || defined(__clang__)
#define WAVELETSCOPE_PLUGIN_API __attribute__((visibility("default")))
#else
#define WAVELETSCOPE_PLUGIN_API
#endif

// Windows shorter than this give the degenerate 1-row result.
static constexpr int kMinWindowSamples = 16;

struct PluginMetadata {
    std::string id;            // stable id, e.g. "builtin:cwt_morlet"
    std::string name;
    std::string kind;          // "cwt", "dwt", "stft", ...
    std::string version;
    std::string description;
};

class ITransformPlugin {
public:
    virtual ~ITransformPlugin() = default;

    virtual PluginMetadata metadata() const = 0;
    virtual Schema describeParameters() const = 0;
    virtual TransformResult transform(const std::vector<float>& samples,
                                      double sampleRate,
                                      const ParamMap& params) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// External module ABI
// ─────────────────────────────────────────────────────────────────────────────

using PluginAbiVersionFn = int (*)();
using PluginCreateFn     = ITransformPlugin* (*)();
using PluginDestroyFn    = void (*)(ITransformPlugin*);

static constexpr const char* kPluginAbiVersionSymbol = "waveletscope_plugin_abi_version";
static constexpr const char* kPluginCreateSymbol     = "waveletscope_create_plugin";
static constexpr const char* kPluginDestroySymbol    = "waveletscope_destroy_plugin";

#define WAVELETSCOPE_EXPORT_TRANSFORM_PLUGIN(PluginClass)                                 \
    extern "C" WAVELETSCOPE_PLUGIN_API int waveletscope_plugin_abi_version() {            \
        return WAVELETSCOPE_PLUGIN_ABI_VERSION;                                           \
    }                                                                                     \
    extern "C" WAVELETSCOPE_PLUGIN_API ITransformPlugin* waveletscope_create_plugin() {   \
        return new PluginClass();                                                         \
    }                                                                                     \
    extern "C" WAVELETSCOPE_PLUGIN_API void waveletscope_destroy_plugin(ITransformPlugin* p) { \
        delete p;                                                                         \
    }
