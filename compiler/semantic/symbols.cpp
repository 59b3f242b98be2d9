#include "symbols.hpp"

#include <algorithm>

namespace enumerant::semantic
{
    std::string qualify(std::string_view scope, std::string_view name)
    {
        if (scope.empty())
        {
            return std::string{name};
        }

        std::string result{scope};
        result.push_back('.');
        result.append(name);
        return result;
    }

    Accessibility accessibilityFromModifiers(const std::vector<std::string>& modifiers)
    {
        if (std::find(modifiers.begin(), modifiers.end(), "public") != modifiers.end())
        {
            return Accessibility::Public;
        }
        if (std::find(modifiers.begin(), modifiers.end(), "private") != modifiers.end())
        {
            return Accessibility::Private;
        }
        return Accessibility::Internal;
    }

    std::string EnumerationSymbol::qualifiedName() const
    {
        return qualify(containingScope, name);
    }

    std::string AttributeTypeSymbol::qualifiedName() const
    {
        return qualify(containingScope, name);
    }

    const UnitScope* SymbolTable::unitScope(std::string_view sourcePath) const
    {
        auto it = m_unitIndex.find(std::string{sourcePath});
        if (it == m_unitIndex.end())
        {
            return nullptr;
        }
        return &m_units[it->second];
    }

    bool SymbolTable::hasModule(std::string_view moduleName) const
    {
        return m_modules.find(std::string{moduleName}) != m_modules.end();
    }

    const AttributeTypeSymbol* SymbolTable::findAttributeType(std::string_view qualifiedName) const
    {
        auto it = m_attributeTypeIndex.find(std::string{qualifiedName});
        if (it == m_attributeTypeIndex.end())
        {
            return nullptr;
        }
        return &m_attributeTypes[it->second];
    }

    const EnumerationSymbol* SymbolTable::findEnumeration(std::string_view qualifiedName) const
    {
        auto it = m_enumerationIndex.find(std::string{qualifiedName});
        if (it == m_enumerationIndex.end())
        {
            return nullptr;
        }
        return &m_enumerations[it->second];
    }

    bool SymbolTable::isVisible(const AttributeTypeSymbol& symbol, const UnitScope* scope) const
    {
        if (symbol.accessibility != Accessibility::Private)
        {
            return true;
        }
        const std::string requesterModule = scope != nullptr ? scope->moduleName : std::string{};
        return requesterModule == symbol.containingScope;
    }

    const AttributeTypeSymbol* SymbolTable::resolveAttributeType(std::string_view writtenName,
                                                                 std::string_view sourcePath) const
    {
        if (writtenName.empty())
        {
            return nullptr;
        }

        const UnitScope* scope = unitScope(sourcePath);

        if (writtenName.find('.') != std::string_view::npos)
        {
            const AttributeTypeSymbol* symbol = findAttributeType(writtenName);
            if (symbol != nullptr && isVisible(*symbol, scope))
            {
                return symbol;
            }
            return nullptr;
        }

        if (scope != nullptr && !scope->moduleName.empty())
        {
            if (const AttributeTypeSymbol* symbol = findAttributeType(qualify(scope->moduleName, writtenName)))
            {
                return symbol;
            }
        }

        if (scope != nullptr)
        {
            for (const auto& importPath : scope->imports)
            {
                const AttributeTypeSymbol* symbol = findAttributeType(qualify(importPath, writtenName));
                if (symbol != nullptr && isVisible(*symbol, scope))
                {
                    return symbol;
                }
            }
        }

        const AttributeTypeSymbol* symbol = findAttributeType(writtenName);
        if (symbol != nullptr && isVisible(*symbol, scope))
        {
            return symbol;
        }
        return nullptr;
    }

    const EnumerationSymbol* SymbolTable::declaredSymbol(const frontend::EnumerationDeclaration& declaration) const
    {
        auto it = m_declarationIndex.find(&declaration);
        if (it == m_declarationIndex.end())
        {
            return nullptr;
        }
        return &m_enumerations[it->second];
    }

    const std::vector<EnumerationSymbol>& SymbolTable::enumerations() const noexcept
    {
        return m_enumerations;
    }

    const std::vector<AttributeTypeSymbol>& SymbolTable::attributeTypes() const noexcept
    {
        return m_attributeTypes;
    }
} // namespace enumerant::semantic
