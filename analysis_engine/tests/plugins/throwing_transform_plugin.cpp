// A module that loads cleanly but whose transform throws a value that is
// not a std::exception. The analysis worker must count it and carry on.

#include "TransformPlugin.hpp"

namespace {

class ThrowingTransformPlugin : public ITransformPlugin {
public:
    PluginMetadata metadata() const override {
        return {"test:throws_int", "Throws int", "test", "0", ""};
    }
    Schema describeParameters() const override { return {}; }
    TransformResult transform(const std::vector<float>&, double, const ParamMap&) const override {
        throw 42;
    }
};

} // namespace

WAVELETSCOPE_EXPORT_TRANSFORM_PLUGIN(ThrowingTransformPlugin)
