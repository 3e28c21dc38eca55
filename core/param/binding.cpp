#include "binding_impl.hpp"

namespace marionette::core::param {

const char* bindingPropertyName(BindingProperty property) {
    switch (property) {
    case BindingProperty::Translation: return "Translation";
    case BindingProperty::Rotation: return "Rotation";
    case BindingProperty::Scale: return "Scale";
    case BindingProperty::Opacity: return "Opacity";
    case BindingProperty::VertexDeform: return "VertexDeform";
    }
    return "Unknown";
}

std::optional<BindingName> parseBindingName(const std::string& name) {
    if (name == "deform") return BindingName{BindingProperty::VertexDeform, -1};
    if (name == "translation") return BindingName{BindingProperty::Translation, -1};
    if (name == "transform.t.x") return BindingName{BindingProperty::Translation, 0};
    if (name == "transform.t.y") return BindingName{BindingProperty::Translation, 1};
    if (name == "rotation" || name == "transform.r.z") return BindingName{BindingProperty::Rotation, 0};
    if (name == "scale") return BindingName{BindingProperty::Scale, -1};
    if (name == "opacity") return BindingName{BindingProperty::Opacity, 0};
    return std::nullopt;
}

std::shared_ptr<ParameterBinding> makeBinding(Parameter* parameter, uint32_t nodeUuid, const std::string& name) {
    auto parsed = parseBindingName(name);
    if (!parsed) return nullptr;
    switch (parsed->property) {
    case BindingProperty::VertexDeform:
        return std::make_shared<DeformationParameterBinding>(parameter, nodeUuid);
    case BindingProperty::Translation:
    case BindingProperty::Scale:
        return std::make_shared<VectorParameterBinding>(parameter, nodeUuid, parsed->property, parsed->component);
    case BindingProperty::Rotation:
    case BindingProperty::Opacity:
        return std::make_shared<ValueParameterBinding>(parameter, nodeUuid, parsed->property);
    }
    return nullptr;
}

} // namespace marionette::core::param
