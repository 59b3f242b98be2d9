#pragma once

#include "ast.hpp"

#include <string>

namespace enumerant::semantic
{
    using enumerant::frontend::SourceSpan;

    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
        std::string sourcePath;
        bool isWarning{false};
    };
} // namespace enumerant::semantic
