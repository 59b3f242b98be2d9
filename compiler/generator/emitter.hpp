#pragma once

#include "enum_to_generate.hpp"

#include <string>

namespace enumerant::generator
{
    struct OutputUnit
    {
        std::string name;
        EnumToGenerate description;
        std::string content;
        // Set when the unit was carried over from an earlier pass without calling the emitter.
        bool reused{false};
    };

    /// Renders the companion source text for one description record.
    class ExtensionEmitter
    {
    public:
        virtual ~ExtensionEmitter() = default;

        virtual std::string render(const EnumToGenerate& record) = 0;
    };

    /// Emits the canonical description text of the record.
    class CanonicalEmitter final : public ExtensionEmitter
    {
    public:
        std::string render(const EnumToGenerate& record) override;
    };
} // namespace enumerant::generator
