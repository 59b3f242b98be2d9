#pragma once

#include "diagnostic.hpp"
#include "symbols.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace enumerant::semantic
{
    struct BindingUnit
    {
        std::string sourcePath;
        const frontend::CompilationUnit* ast{nullptr};
    };

    /// Builds the whole-program symbol table: registers every unit's scope, attribute types and
    /// enumerations, resolves attribute names and folds enumeration member values.
    class Binder
    {
    public:
        explicit Binder(std::vector<BindingUnit> units);

        [[nodiscard]] SymbolTable bind();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        template <typename AttributeRange>
        void checkDuplicateAttributes(const AttributeRange& attributes, const std::string& sourcePath);

        bool registerUnit(const BindingUnit& unit, SymbolTable& table);
        void checkImports(const BindingUnit& unit, const SymbolTable& table);
        bool registerTypeName(const std::string& qualifiedName, std::string_view kind, SourceSpan span, const std::string& sourcePath);
        void registerAttributeType(const frontend::AttributeDeclaration& declaration, const UnitScope& scope, SymbolTable& table);
        void registerEnumeration(const frontend::EnumerationDeclaration& declaration, const UnitScope& scope, SymbolTable& table);

        AttributeData convertAttribute(const frontend::Attribute& attribute, const std::string& sourcePath, const SymbolTable& table);
        std::vector<EnumerationMemberSymbol> bindMembers(const frontend::EnumerationDeclaration& declaration,
                                                         const std::optional<std::string>& storageType,
                                                         const std::string& sourcePath);

        void emitError(const std::string& code, const std::string& message, SourceSpan span, const std::string& sourcePath);
        void emitWarning(const std::string& code, const std::string& message, SourceSpan span, const std::string& sourcePath);

    private:
        std::vector<BindingUnit> m_units;
        std::vector<Diagnostic> m_diagnostics;
        std::unordered_map<std::string, SourceSpan> m_typeSymbols;
    };
} // namespace enumerant::semantic
