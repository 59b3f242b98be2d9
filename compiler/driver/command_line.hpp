#pragma once

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enumerant
{
    struct CommandLineOptions
    {
        std::vector<std::string> inputPaths;
        std::string outputDirectory;
        bool showHelp{false};
        bool showVersion{false};
        bool showHash{false};
        bool injectMarkerUnit{true};
        unsigned repeatCount{1};
        std::optional<std::string> descriptionBundlePath;
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--show-hash")
                {
                    options.showHash = true;
                    continue;
                }

                if (argument == "--no-bootstrap")
                {
                    options.injectMarkerUnit = false;
                    continue;
                }

                if (argument.rfind("--repeat=", 0) == 0)
                {
                    constexpr std::string_view repeatOpt = "--repeat=";
                    const std::string_view value = argument.substr(repeatOpt.size());
                    unsigned count = 0;
                    const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), count);
                    if (error != std::errc{} || end != value.data() + value.size() || count == 0)
                    {
                        std::cerr << "ENR-E1005 InvalidRepeat: expected a positive pass count, got '" << value << "'.\n";
                        return std::nullopt;
                    }
                    options.repeatCount = count;
                    continue;
                }

                if (argument.rfind("--emit-descriptions=", 0) == 0)
                {
                    constexpr std::string_view bundleOpt = "--emit-descriptions=";
                    options.descriptionBundlePath = std::string{argument.substr(bundleOpt.size())};
                    continue;
                }

                if (argument == "--emit-descriptions")
                {
                    if (index + 1 < argc)
                    {
                        options.descriptionBundlePath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "ENR-E1004 MissingDescriptionBundle: expected path after --emit-descriptions option.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("-o", 0) == 0)
                {
                    if (argument.size() > 2)
                    {
                        options.outputDirectory = std::string{argument.substr(2)};
                    }
                    else if (index + 1 < argc)
                    {
                        options.outputDirectory = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "ENR-E1000 MissingOutput: expected directory after -o option.\n";
                        return std::nullopt;
                    }

                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "ENR-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            if (!options.showHelp && !options.showVersion && options.inputPaths.empty())
            {
                std::cerr << "ENR-E1002 MissingInput: at least one input file is required.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace enumerant
