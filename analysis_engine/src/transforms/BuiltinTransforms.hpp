#pragma once

#include <memory>
#include <vector>

#include "TransformPlugin.hpp"

/// Transforms compiled into the engine, in registration order.
/// PluginRegistry loads these before scanning for external modules.
std::vector<std::shared_ptr<ITransformPlugin>> makeBuiltinTransforms();
