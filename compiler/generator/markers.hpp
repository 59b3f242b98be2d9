#pragma once

#include <string_view>

namespace enumerant::generator
{
    inline constexpr std::string_view kEnumExtensionsMarker = "enumerant.markers.EnumExtensions";
    inline constexpr std::string_view kFlagsMarker = "enumerant.markers.Flags";

    inline constexpr std::string_view kExtensionClassNameOption = "ExtensionClassName";
    inline constexpr std::string_view kExtensionClassNamespaceOption = "ExtensionClassNamespace";

    inline constexpr std::string_view kMarkerUnitPath = "enumerant/markers.bolt";

    enum class MarkerKind
    {
        None,
        EnumExtensions,
        Flags
    };

    /// Maps a resolved attribute-type identity to the marker it denotes. Comparison is by
    /// fully qualified name only.
    [[nodiscard]] MarkerKind classifyMarker(std::string_view attributeClass) noexcept;

    /// Source text of the marker declarations injected into every program.
    [[nodiscard]] std::string_view markerUnitSource() noexcept;
} // namespace enumerant::generator
