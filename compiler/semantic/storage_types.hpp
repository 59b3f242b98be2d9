#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace enumerant::semantic
{
    /// An integral type usable as enumeration storage. Member values are carried as 64-bit
    /// patterns; `isUnsigned` says how to read them.
    struct StorageType
    {
        std::string_view name;
        std::string_view normalizedName;
        bool isUnsigned{false};
        std::int64_t minimum{0};
        std::uint64_t maximum{0};
    };

    [[nodiscard]] const StorageType* findStorageType(std::string_view name);

    [[nodiscard]] bool fitsStorage(const StorageType& type, std::int64_t bits) noexcept;

    /// Decimal text of `bits` as a value of the named storage type. Unknown names read signed.
    [[nodiscard]] std::string formatStorageValue(std::string_view typeName, std::int64_t bits);
} // namespace enumerant::semantic
