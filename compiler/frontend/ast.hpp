#pragma once

#include "token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enumerant::frontend
{
    enum class AttributeValueKind
    {
        Missing,
        String,
        Integer,
        Boolean,
        Null,
        Identifier
    };

    struct AttributeArgument
    {
        std::string name;
        std::string value;
        AttributeValueKind valueKind{AttributeValueKind::Missing};
        SourceSpan span;
    };

    struct Attribute
    {
        std::string name;
        std::vector<AttributeArgument> arguments;
        SourceSpan span;
    };

    struct Parameter
    {
        std::string name;
        std::string typeName;
        SourceSpan span;
        SourceSpan typeSpan;
    };

    struct FunctionDeclaration
    {
        std::vector<Attribute> attributes;
        std::vector<std::string> modifiers;
        std::string name;
        std::vector<Parameter> parameters;
        std::optional<std::string> returnType;
        std::optional<SourceSpan> returnTypeSpan;
        SourceSpan span;
    };

    struct BlueprintField
    {
        std::vector<Attribute> attributes;
        std::string name;
        std::string typeName;
        SourceSpan span;
        SourceSpan typeSpan;
    };

    struct BlueprintDeclaration
    {
        std::vector<Attribute> attributes;
        std::vector<std::string> modifiers;
        std::string name;
        std::vector<BlueprintField> fields;
        SourceSpan span;
    };

    // Attribute types share the blueprint field grammar; each field is a named option.
    struct AttributeDeclaration
    {
        std::vector<Attribute> attributes;
        std::vector<std::string> modifiers;
        std::string name;
        std::vector<BlueprintField> options;
        SourceSpan span;
    };

    // Unevaluated member initializer; the binder folds it to a constant.
    struct ExpressionCapture
    {
        std::vector<Token> tokens;
        SourceSpan span{};
    };

    struct EnumerationMember
    {
        std::vector<Attribute> attributes;
        std::string name;
        std::optional<ExpressionCapture> initializer;
        SourceSpan span;
    };

    struct EnumerationDeclaration
    {
        std::vector<Attribute> attributes;
        std::vector<std::string> modifiers;
        std::string name;
        std::optional<std::string> underlyingType;
        std::optional<SourceSpan> underlyingTypeSpan;
        std::vector<EnumerationMember> members;
        SourceSpan span;
    };

    struct ImportDeclaration
    {
        std::string modulePath;
        SourceSpan span;
    };

    struct ModuleDeclaration
    {
        std::string packageName;
        std::string moduleName;
        bool isDeclared{false};
        SourceSpan span;
    };

    struct CompilationUnit
    {
        ModuleDeclaration module;
        std::vector<ImportDeclaration> imports;
        std::vector<FunctionDeclaration> functions;
        std::vector<BlueprintDeclaration> blueprints;
        std::vector<AttributeDeclaration> attributeTypes;
        std::vector<EnumerationDeclaration> enumerations;
    };
} // namespace enumerant::frontend
