#include "storage_types.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace enumerant::semantic
{
    namespace
    {
        constexpr std::array<StorageType, 10> kStorageTypes{{
            {"integer8", "integer8", false, -128, 127},
            {"integer16", "integer16", false, -32768, 32767},
            {"integer32", "integer32", false, -2147483648LL, 2147483647ULL},
            {"integer", "integer32", false, -2147483648LL, 2147483647ULL},
            {"integer64", "integer64", false, std::numeric_limits<std::int64_t>::min(), 9223372036854775807ULL},
            {"natural8", "natural8", true, 0, 255},
            {"byte", "natural8", true, 0, 255},
            {"natural16", "natural16", true, 0, 65535},
            {"natural32", "natural32", true, 0, 4294967295ULL},
            {"natural64", "natural64", true, 0, std::numeric_limits<std::uint64_t>::max()},
        }};
    } // namespace

    const StorageType* findStorageType(std::string_view name)
    {
        auto it = std::find_if(kStorageTypes.begin(), kStorageTypes.end(), [name](const StorageType& type) {
            return type.name == name;
        });
        return it == kStorageTypes.end() ? nullptr : &*it;
    }

    bool fitsStorage(const StorageType& type, std::int64_t bits) noexcept
    {
        if (type.isUnsigned)
        {
            return static_cast<std::uint64_t>(bits) <= type.maximum;
        }
        return bits >= type.minimum && (bits < 0 || static_cast<std::uint64_t>(bits) <= type.maximum);
    }

    std::string formatStorageValue(std::string_view typeName, std::int64_t bits)
    {
        const StorageType* type = findStorageType(typeName);
        if (type != nullptr && type->isUnsigned)
        {
            return std::to_string(static_cast<std::uint64_t>(bits));
        }
        return std::to_string(bits);
    }
} // namespace enumerant::semantic
