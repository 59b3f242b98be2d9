#include "command_line.hpp"
#include "description_bundle_writer.hpp"
#include "emitter.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#ifndef ENUMERANT_BUILD_PROFILE
#define ENUMERANT_BUILD_PROFILE "local"
#endif

namespace enumerant
{
    void printHelp()
    {
        std::cout << "enumerantc - enumeration extension generator\n"
                  << "Usage: enumerantc [options] <input>...\n\n"
                  << "Options:\n"
                  << "  --help                 Show this help text and exit.\n"
                  << "  --version              Show version information and exit.\n"
                  << "  --show-hash            Print the description fingerprint of every output unit.\n"
                  << "  --no-bootstrap         Do not inject the marker declarations unit.\n"
                  << "  --repeat=<n>           Run <n> passes over the same inputs. Default: 1.\n"
                  << "  --emit-descriptions=<path> Write the description bundle of the last pass.\n"
                  << "  -o <dir>               Write one file per output unit into the directory.\n";
    }

    void printVersion()
    {
        std::cout << "enumerantc (build profile: " << ENUMERANT_BUILD_PROFILE << ")\n";
    }

    std::optional<std::string> loadFile(const std::string& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    bool reportDiagnostics(const std::vector<semantic::Diagnostic>& diagnostics)
    {
        bool hasErrors = false;
        std::string currentPath;
        for (const auto& diagnostic : diagnostics)
        {
            if (diagnostic.sourcePath != currentPath)
            {
                currentPath = diagnostic.sourcePath;
                std::cerr << "In '" << currentPath << "':\n";
            }
            std::cerr << diagnostic.code << ' '
                      << "L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
                      << " -> "
                      << diagnostic.message << '\n';
            hasErrors = hasErrors || !diagnostic.isWarning;
        }
        return hasErrors;
    }

    bool writeOutputUnits(const std::filesystem::path& directory, const std::vector<generator::OutputUnit>& outputs)
    {
        std::error_code createError;
        std::filesystem::create_directories(directory, createError);
        if (createError)
        {
            std::cerr << "ENR-E3004 OutputWriteFailed: unable to create '" << directory.string()
                      << "': " << createError.message() << "\n";
            return false;
        }

        bool success = true;
        for (const auto& unit : outputs)
        {
            const std::filesystem::path filePath = directory / (unit.name + ".g.bolt");
            std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
            if (!file)
            {
                std::cerr << "ENR-E3004 OutputWriteFailed: unable to open '" << filePath.string() << "'.\n";
                success = false;
                continue;
            }
            file << unit.content;
            if (!file.good())
            {
                std::cerr << "ENR-E3004 OutputWriteFailed: failed while writing '" << filePath.string() << "'.\n";
                success = false;
            }
        }
        return success;
    }

    int runGenerator(const CommandLineOptions& options)
    {
        std::cout << "[information] Starting enumerantc pipeline.\n";
        std::cout << "  passes: " << options.repeatCount << "\n";
        std::cout << "  bootstrap: " << (options.injectMarkerUnit ? "on" : "off") << "\n";

        if (!options.outputDirectory.empty())
        {
            std::cout << "  output: " << options.outputDirectory << "\n";
        }

        int exitCode = 0;
        generator::ProgramSnapshot snapshot;
        for (const auto& path : options.inputPaths)
        {
            std::cout << "  input: " << path << "\n";

            const auto content = loadFile(path);
            if (!content.has_value())
            {
                std::cerr << "ENR-E3000 InputReadFailed: unable to open '" << path << "'.\n";
                exitCode = 1;
                continue;
            }
            snapshot.sources.push_back(generator::SourceText{path, *content});
        }

        if (exitCode != 0)
        {
            std::cerr << "ENR-W3001 Pipeline halted while reading inputs.\n";
            return exitCode;
        }

        generator::CanonicalEmitter emitter;
        generator::PipelineOptions pipelineOptions;
        pipelineOptions.injectMarkerUnit = options.injectMarkerUnit;
        generator::Pipeline pipeline{emitter, pipelineOptions};

        generator::PassResult pass;
        for (unsigned passIndex = 1; passIndex <= options.repeatCount; ++passIndex)
        {
            pass = pipeline.supply(snapshot);

            std::cout << "[notice] Pass " << passIndex << ": parsed " << pass.parsedUnits
                      << " unit(s), reused " << pass.reusedUnits << " unit(s), "
                      << pass.candidates << " opted-in enumeration(s).\n";
            std::cout << "[notice] Pass " << passIndex << ": emitted " << pass.emitted
                      << ", reused " << pass.reused << " output unit(s).\n";

            for (const auto& unit : pass.outputs)
            {
                std::cout << "[debug]   " << unit.name << " <- " << unit.description.declaredQualifiedName
                          << (unit.reused ? " (reused)" : " (emitted)");
                if (options.showHash)
                {
                    std::cout << " hash 0x" << std::hex << generator::canonicalHash(unit.description) << std::dec;
                }
                std::cout << '\n';
            }

            if (reportDiagnostics(pass.diagnostics))
            {
                exitCode = 1;
            }
        }

        if (!options.outputDirectory.empty())
        {
            if (!writeOutputUnits(options.outputDirectory, pass.outputs))
            {
                exitCode = 1;
            }
            else
            {
                std::cout << "[notice] Wrote " << pass.outputs.size() << " output unit(s) to "
                          << options.outputDirectory << "\n";
            }
        }

        if (options.descriptionBundlePath.has_value())
        {
            std::string errorMessage;
            if (!writeDescriptionBundle(*options.descriptionBundlePath, pass, errorMessage))
            {
                std::cerr << "ENR-E3003 DescriptionBundleWriteFailed: " << errorMessage << "\n";
                exitCode = 1;
            }
            else
            {
                std::cout << "[notice] Description bundle written to " << *options.descriptionBundlePath << "\n";
            }
        }

        if (exitCode == 0)
        {
            std::cout << "[notice] Extension generation completed.\n";
        }
        else
        {
            std::cerr << "ENR-W3001 Pipeline completed with errors.\n";
        }

        return exitCode;
    }
} // namespace enumerant

int main(int argc, char** argv)
{
    enumerant::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        enumerant::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        enumerant::printVersion();
        return 0;
    }

    return enumerant::runGenerator(options.value());
}
