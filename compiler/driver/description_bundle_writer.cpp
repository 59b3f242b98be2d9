#include "description_bundle_writer.hpp"

#include "storage_types.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <system_error>

namespace enumerant
{
    namespace
    {
        char hexDigit(unsigned value)
        {
            return static_cast<char>(value < 10 ? ('0' + value) : ('a' + (value - 10)));
        }

        std::string escapeJson(std::string_view value)
        {
            std::string result;
            result.reserve(value.size() + 8);

            for (unsigned char ch : value)
            {
                switch (ch)
                {
                case '\\':
                    result += "\\\\";
                    break;
                case '"':
                    result += "\\\"";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (ch < 0x20)
                    {
                        result += "\\u00";
                        result.push_back(hexDigit((ch >> 4) & 0xF));
                        result.push_back(hexDigit(ch & 0xF));
                    }
                    else
                    {
                        result.push_back(static_cast<char>(ch));
                    }
                    break;
                }
            }

            return result;
        }

        std::string_view toBool(bool value)
        {
            return value ? "true" : "false";
        }

        std::string fingerprint(const generator::EnumToGenerate& record)
        {
            std::ostringstream stream;
            stream << "0x" << std::hex << std::setw(16) << std::setfill('0') << generator::canonicalHash(record);
            return stream.str();
        }

        void writeUnit(std::ostringstream& stream, const generator::OutputUnit& unit)
        {
            const auto& record = unit.description;
            stream << "    {\n";
            stream << "      \"unit\": \"" << escapeJson(unit.name) << "\",\n";
            stream << "      \"fingerprint\": \"" << fingerprint(record) << "\",\n";
            stream << "      \"status\": \"" << (unit.reused ? "reused" : "emitted") << "\",\n";
            stream << "      \"outputName\": \"" << escapeJson(record.outputName) << "\",\n";
            stream << "      \"outputNamespace\": \"" << escapeJson(record.outputNamespace) << "\",\n";
            stream << "      \"declaredName\": \"" << escapeJson(record.declaredQualifiedName) << "\",\n";
            stream << "      \"underlyingType\": \"" << escapeJson(record.underlyingType) << "\",\n";
            stream << "      \"isPublic\": " << toBool(record.isPublic) << ",\n";
            stream << "      \"hasFlags\": " << toBool(record.hasFlags) << ",\n";

            if (record.members.empty())
            {
                stream << "      \"members\": []\n";
            }
            else
            {
                stream << "      \"members\": [\n";
                for (std::size_t index = 0; index < record.members.size(); ++index)
                {
                    const auto& [name, value] = record.members[index];
                    stream << "        { \"name\": \"" << escapeJson(name) << "\", \"value\": "
                           << semantic::formatStorageValue(record.underlyingType, value) << " }";
                    if (index + 1 < record.members.size())
                    {
                        stream << ",";
                    }
                    stream << "\n";
                }
                stream << "      ]\n";
            }
            stream << "    }";
        }
    } // namespace

    bool writeDescriptionBundle(const std::filesystem::path& outputPath,
        const generator::PassResult& pass,
        std::string& errorMessage)
    {
        std::ostringstream stream;

        stream << "{\n";
        stream << "  \"pass\": {\n";
        stream << "    \"cancelled\": " << toBool(pass.cancelled) << ",\n";
        stream << "    \"emitted\": " << pass.emitted << ",\n";
        stream << "    \"reused\": " << pass.reused << "\n";
        stream << "  },\n";

        if (pass.outputs.empty())
        {
            stream << "  \"units\": []\n";
        }
        else
        {
            stream << "  \"units\": [\n";
            for (std::size_t index = 0; index < pass.outputs.size(); ++index)
            {
                writeUnit(stream, pass.outputs[index]);
                if (index + 1 < pass.outputs.size())
                {
                    stream << ",";
                }
                stream << "\n";
            }
            stream << "  ]\n";
        }
        stream << "}\n";

        const auto parentDirectory = outputPath.parent_path();
        if (!parentDirectory.empty())
        {
            std::error_code createError;
            std::filesystem::create_directories(parentDirectory, createError);
            if (createError)
            {
                errorMessage = "failed to create directories for '" + outputPath.string() + "': " + createError.message();
                return false;
            }
        }

        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            errorMessage = "unable to open '" + outputPath.string() + "' for writing.";
            return false;
        }

        file << stream.str();
        if (!file.good())
        {
            errorMessage = "failed while writing description bundle to '" + outputPath.string() + "'.";
            return false;
        }

        return true;
    }
} // namespace enumerant
