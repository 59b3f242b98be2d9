#pragma once

#include "pipeline.hpp"

#include <filesystem>
#include <string>

namespace enumerant
{
    /// Writes every output unit of a pass as a JSON manifest: unit name, fingerprint,
    /// emission status and the full description record.
    bool writeDescriptionBundle(const std::filesystem::path& outputPath,
        const generator::PassResult& pass,
        std::string& errorMessage);
}
