#include "enum_to_generate.hpp"

#include "storage_types.hpp"

#include <sstream>

namespace enumerant::generator
{
    bool operator==(const EnumToGenerate& lhs, const EnumToGenerate& rhs)
    {
        return lhs.outputName == rhs.outputName
            && lhs.declaredQualifiedName == rhs.declaredQualifiedName
            && lhs.outputNamespace == rhs.outputNamespace
            && lhs.isPublic == rhs.isPublic
            && lhs.hasFlags == rhs.hasFlags
            && lhs.underlyingType == rhs.underlyingType
            && lhs.members == rhs.members;
    }

    bool operator!=(const EnumToGenerate& lhs, const EnumToGenerate& rhs)
    {
        return !(lhs == rhs);
    }

    std::string outputUnitName(const EnumToGenerate& record)
    {
        return record.outputName + "_EnumExtensions";
    }

    std::string canonicalPrint(const EnumToGenerate& record)
    {
        std::ostringstream stream;
        stream << "extension " << record.outputName << '\n';
        stream << "  namespace " << (record.outputNamespace.empty() ? "<global>" : record.outputNamespace) << '\n';
        stream << "  source " << record.declaredQualifiedName << '\n';
        stream << "  storage " << record.underlyingType << '\n';
        stream << "  public " << (record.isPublic ? "yes" : "no") << '\n';
        stream << "  flags " << (record.hasFlags ? "yes" : "no") << '\n';
        stream << "  members " << record.members.size() << '\n';
        for (const auto& [name, value] : record.members)
        {
            stream << "    " << name << " = " << semantic::formatStorageValue(record.underlyingType, value) << '\n';
        }
        return stream.str();
    }

    std::uint64_t canonicalHash(const EnumToGenerate& record)
    {
        const std::string canonical = canonicalPrint(record);
        constexpr std::uint64_t offset = 1469598103934665603ull;
        constexpr std::uint64_t prime = 1099511628211ull;

        std::uint64_t hash = offset;
        for (unsigned char c : canonical)
        {
            hash ^= static_cast<std::uint64_t>(c);
            hash *= prime;
        }
        return hash;
    }
} // namespace enumerant::generator
