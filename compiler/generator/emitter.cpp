#include "emitter.hpp"

namespace enumerant::generator
{
    std::string CanonicalEmitter::render(const EnumToGenerate& record)
    {
        return canonicalPrint(record);
    }
} // namespace enumerant::generator
