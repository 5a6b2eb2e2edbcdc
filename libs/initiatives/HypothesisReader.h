#pragma once

#include <string>
#include <vector>
#include "InitiativeTypes.h"

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Reads initiative hypotheses from a JSON array of
 * { "title", "category", "description" } objects.
 *
 * Any failure (unreadable file, malformed JSON, wrong shape) yields an empty
 * list and a logged warning; the analysis then proceeds with no hypotheses.
 * Entries without a non-empty title are skipped. Categories are resolved
 * with resolveCategory().
 */
class HypothesisReader
{
public:
    static std::vector<InitiativeHypothesis> readFile(const std::string& filePath);
    static std::vector<InitiativeHypothesis> readString(const std::string& json);
};

} // namespace initiatives
} // namespace ebitdascope
