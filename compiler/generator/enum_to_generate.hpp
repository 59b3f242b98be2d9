#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace enumerant::generator
{
    inline constexpr const char* kDefaultUnderlyingType = "integer32";

    /// Value description of one opted-in enumeration. Two records compare equal only when
    /// every field matches, members included element by element and in order.
    struct EnumToGenerate
    {
        std::string outputName;
        std::string declaredQualifiedName;
        std::string outputNamespace;
        bool isPublic{false};
        bool hasFlags{false};
        std::string underlyingType{kDefaultUnderlyingType};
        // 64-bit patterns; unsigned storage types read them as unsigned.
        std::vector<std::pair<std::string, std::int64_t>> members;
    };

    bool operator==(const EnumToGenerate& lhs, const EnumToGenerate& rhs);
    bool operator!=(const EnumToGenerate& lhs, const EnumToGenerate& rhs);

    [[nodiscard]] std::string outputUnitName(const EnumToGenerate& record);

    std::string canonicalPrint(const EnumToGenerate& record);
    std::uint64_t canonicalHash(const EnumToGenerate& record);
} // namespace enumerant::generator
