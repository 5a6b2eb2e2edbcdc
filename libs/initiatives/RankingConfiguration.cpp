#include "RankingConfiguration.h"
#include <cmath>
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
void requirePositive(const char* name, double value)
{
    if (!std::isfinite(value) || value <= 0.0)
        throw RankingConfigurationException(std::string(name) + " must be a finite value > 0, got "
                                            + std::to_string(value));
}

void requireNonNegative(const char* name, double value)
{
    if (!std::isfinite(value) || value < 0.0)
        throw RankingConfigurationException(std::string(name) + " must be a finite value >= 0, got "
                                            + std::to_string(value));
}

void readNumber(const Value& doc, const char* key, double& target)
{
    if (!doc.HasMember(key))
        return;

    const Value& value = doc[key];
    if (!value.IsNumber())
        throw RankingConfigurationException(std::string("Ranking configuration key ") + key
                                            + " is not a number");
    target = value.GetDouble();
}
} // namespace

void RankingConfiguration::validate() const
{
    requirePositive("risk_multiplier_low", riskMultiplierLow);
    requirePositive("risk_multiplier_med", riskMultiplierMed);
    requirePositive("risk_multiplier_high", riskMultiplierHigh);
    requireNonNegative("time_multiplier_base", timeMultiplierBase);
    requireNonNegative("time_multiplier_per_week", timeMultiplierPerWeek);
}

double RankingConfiguration::riskMultiplier(RiskLevel level) const
{
    switch (level)
    {
    case RiskLevel::Low:
        return riskMultiplierLow;
    case RiskLevel::Med:
        return riskMultiplierMed;
    case RiskLevel::High:
        return riskMultiplierHigh;
    }
    throw RankingConfigurationException("riskMultiplier: unknown risk level");
}

RankingConfiguration RankingConfigurationReader::readString(const std::string& json)
{
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
        throw RankingConfigurationException(std::string("Ranking configuration parse error at offset ")
                                            + std::to_string(doc.GetErrorOffset()) + ": "
                                            + GetParseError_En(doc.GetParseError()));
    if (!doc.IsObject())
        throw RankingConfigurationException("Ranking configuration must be a JSON object");

    RankingConfiguration config;
    readNumber(doc, "risk_multiplier_low", config.riskMultiplierLow);
    readNumber(doc, "risk_multiplier_med", config.riskMultiplierMed);
    readNumber(doc, "risk_multiplier_high", config.riskMultiplierHigh);
    readNumber(doc, "time_multiplier_base", config.timeMultiplierBase);
    readNumber(doc, "time_multiplier_per_week", config.timeMultiplierPerWeek);

    config.validate();
    return config;
}

RankingConfiguration RankingConfigurationReader::readFile(const std::string& filePath)
{
    std::ifstream file(filePath);
    if (!file.is_open())
        throw RankingConfigurationException("Cannot open ranking configuration: " + filePath);

    std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    RankingConfiguration config = readString(json);
    spdlog::info("Loaded ranking configuration from {}", filePath);
    return config;
}

} // namespace initiatives
} // namespace ebitdascope
