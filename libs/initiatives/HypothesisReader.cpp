#include "HypothesisReader.h"
#include <fstream>
#include <iterator>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <spdlog/spdlog.h>

using namespace rapidjson;

namespace ebitdascope
{
namespace initiatives
{

namespace
{
std::string stringMember(const Value& obj, const char* key)
{
    if (obj.HasMember(key) && obj[key].IsString())
        return std::string(obj[key].GetString(), obj[key].GetStringLength());
    return std::string();
}
} // namespace

std::vector<InitiativeHypothesis> HypothesisReader::readString(const std::string& json)
{
    std::vector<InitiativeHypothesis> hypotheses;

    Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError())
    {
        spdlog::warn("Hypotheses ignored, JSON parse error at offset {}: {}", doc.GetErrorOffset(),
                     GetParseError_En(doc.GetParseError()));
        return hypotheses;
    }

    // Accept a bare array or { "hypotheses": [...] }
    const Value* list = &doc;
    if (doc.IsObject() && doc.HasMember("hypotheses"))
        list = &doc["hypotheses"];

    if (!list->IsArray())
    {
        spdlog::warn("Hypotheses ignored, expected a JSON array");
        return hypotheses;
    }

    for (const auto& entry : list->GetArray())
    {
        if (!entry.IsObject())
        {
            spdlog::warn("Skipping hypothesis entry that is not an object");
            continue;
        }

        InitiativeHypothesis hypothesis;
        hypothesis.title = stringMember(entry, "title");
        if (hypothesis.title.empty())
        {
            spdlog::warn("Skipping hypothesis without a title");
            continue;
        }

        hypothesis.description = stringMember(entry, "description");
        hypothesis.category = resolveCategory(stringMember(entry, "category"), hypothesis.title);
        hypotheses.push_back(std::move(hypothesis));
    }

    spdlog::debug("Read {} hypothesis(es)", hypotheses.size());
    return hypotheses;
}

std::vector<InitiativeHypothesis> HypothesisReader::readFile(const std::string& filePath)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        spdlog::warn("Cannot open hypotheses file {}, continuing with none", filePath);
        return std::vector<InitiativeHypothesis>();
    }

    std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return readString(json);
}

} // namespace initiatives
} // namespace ebitdascope
