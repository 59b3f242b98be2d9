#pragma once

#include "ast.hpp"
#include "diagnostic.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace enumerant::semantic
{
    enum class Accessibility
    {
        Public,
        Internal,
        Private
    };

    struct NamedArgument
    {
        std::string name;
        // Empty when the written value has no string form (null, unresolved identifier).
        std::optional<std::string> value;
        SourceSpan span;
    };

    struct AttributeData
    {
        std::string writtenName;
        // Fully qualified identity of the attribute type; empty when the name does not resolve.
        std::optional<std::string> attributeClass;
        std::vector<std::optional<std::string>> positionalArguments;
        std::vector<NamedArgument> namedArguments;
        SourceSpan span;
    };

    struct EnumerationMemberSymbol
    {
        std::string name;
        std::optional<std::int64_t> constantValue;
        SourceSpan span;
    };

    struct EnumerationSymbol
    {
        std::string name;
        std::string containingScope;
        std::string sourcePath;
        std::optional<std::string> underlyingType;
        Accessibility accessibility{Accessibility::Internal};
        std::vector<AttributeData> attributes;
        std::vector<EnumerationMemberSymbol> members;
        SourceSpan span;

        [[nodiscard]] std::string qualifiedName() const;
    };

    struct AttributeTypeSymbol
    {
        std::string name;
        std::string containingScope;
        std::string sourcePath;
        Accessibility accessibility{Accessibility::Internal};
        std::vector<std::string> optionNames;
        SourceSpan span;

        [[nodiscard]] std::string qualifiedName() const;
    };

    struct UnitScope
    {
        std::string sourcePath;
        std::string moduleName;
        std::vector<std::string> imports;
    };

    [[nodiscard]] std::string qualify(std::string_view scope, std::string_view name);
    [[nodiscard]] Accessibility accessibilityFromModifiers(const std::vector<std::string>& modifiers);

    /// Whole-program symbol table for one analysis pass. Built once by the Binder and
    /// read-only afterwards; lookups never mutate it.
    class SymbolTable
    {
    public:
        [[nodiscard]] const UnitScope* unitScope(std::string_view sourcePath) const;
        [[nodiscard]] bool hasModule(std::string_view moduleName) const;

        [[nodiscard]] const AttributeTypeSymbol* findAttributeType(std::string_view qualifiedName) const;
        [[nodiscard]] const EnumerationSymbol* findEnumeration(std::string_view qualifiedName) const;

        /// Resolves an attribute name as written in `sourcePath`: dotted names are fully
        /// qualified; plain names search the unit's module, then its imports, then the
        /// outermost scope. Returns nullptr when nothing visible matches.
        [[nodiscard]] const AttributeTypeSymbol* resolveAttributeType(std::string_view writtenName,
                                                                      std::string_view sourcePath) const;

        [[nodiscard]] const EnumerationSymbol* declaredSymbol(const frontend::EnumerationDeclaration& declaration) const;

        [[nodiscard]] const std::vector<EnumerationSymbol>& enumerations() const noexcept;
        [[nodiscard]] const std::vector<AttributeTypeSymbol>& attributeTypes() const noexcept;

    private:
        friend class Binder;

        [[nodiscard]] bool isVisible(const AttributeTypeSymbol& symbol, const UnitScope* scope) const;

        std::vector<UnitScope> m_units;
        std::vector<AttributeTypeSymbol> m_attributeTypes;
        std::vector<EnumerationSymbol> m_enumerations;
        std::unordered_map<std::string, std::size_t> m_unitIndex;
        std::unordered_map<std::string, std::size_t> m_attributeTypeIndex;
        std::unordered_map<std::string, std::size_t> m_enumerationIndex;
        std::unordered_map<const frontend::EnumerationDeclaration*, std::size_t> m_declarationIndex;
        std::unordered_set<std::string> m_modules;
    };
} // namespace enumerant::semantic
