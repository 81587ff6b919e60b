#include "BuiltinTransforms.hpp"

#include "CwtTransform.hpp"
#include "DwtTransform.hpp"

std::vector<std::shared_ptr<ITransformPlugin>> makeBuiltinTransforms() {
    return {
        std::make_shared<CwtTransform>(),
        std::make_shared<DwtTransform>(),
    };
}
