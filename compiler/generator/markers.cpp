#include "markers.hpp"

namespace enumerant::generator
{
    MarkerKind classifyMarker(std::string_view attributeClass) noexcept
    {
        if (attributeClass == kEnumExtensionsMarker)
        {
            return MarkerKind::EnumExtensions;
        }
        if (attributeClass == kFlagsMarker)
        {
            return MarkerKind::Flags;
        }
        return MarkerKind::None;
    }

    std::string_view markerUnitSource() noexcept
    {
        return R"(package enumerant; module enumerant.markers;

public attribute EnumExtensions {
    string ExtensionClassName;
    string ExtensionClassNamespace;
}

public attribute Flags {
}
)";
    }
} // namespace enumerant::generator
