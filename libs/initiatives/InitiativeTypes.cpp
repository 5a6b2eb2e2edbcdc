#include "InitiativeTypes.h"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace ebitdascope
{
namespace initiatives
{

namespace
{
std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Letters and digits only, lower-cased: "Sales & Marketing" -> "salesmarketing"
std::string normalizeLabel(const std::string& text)
{
    std::string out;
    for (unsigned char c : text)
    {
        if (std::isalnum(c))
            out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles)
{
    for (const char* needle : needles)
    {
        if (haystack.find(needle) != std::string::npos)
            return true;
    }
    return false;
}
} // namespace

std::string initiativeCategoryName(InitiativeCategory category)
{
    switch (category)
    {
    case InitiativeCategory::Vendor:
        return "Vendor";
    case InitiativeCategory::Headcount:
        return "Headcount";
    case InitiativeCategory::Pricing:
        return "Pricing";
    case InitiativeCategory::Process:
        return "Process";
    case InitiativeCategory::Infrastructure:
        return "Infrastructure";
    case InitiativeCategory::SalesMarketing:
        return "SalesMarketing";
    case InitiativeCategory::Other:
        return "Other";
    }
    throw std::invalid_argument("initiativeCategoryName: unknown category");
}

std::optional<InitiativeCategory> parseInitiativeCategory(const std::string& label)
{
    static const std::vector<std::pair<std::string, InitiativeCategory>> aliases{
        {"vendor", InitiativeCategory::Vendor},
        {"vendors", InitiativeCategory::Vendor},
        {"procurement", InitiativeCategory::Vendor},
        {"saas", InitiativeCategory::Vendor},
        {"software", InitiativeCategory::Vendor},
        {"headcount", InitiativeCategory::Headcount},
        {"workforce", InitiativeCategory::Headcount},
        {"people", InitiativeCategory::Headcount},
        {"payroll", InitiativeCategory::Headcount},
        {"pricing", InitiativeCategory::Pricing},
        {"price", InitiativeCategory::Pricing},
        {"process", InitiativeCategory::Process},
        {"operations", InitiativeCategory::Process},
        {"automation", InitiativeCategory::Process},
        {"infrastructure", InitiativeCategory::Infrastructure},
        {"cloud", InitiativeCategory::Infrastructure},
        {"salesmarketing", InitiativeCategory::SalesMarketing},
        {"salesandmarketing", InitiativeCategory::SalesMarketing},
        {"gotomarket", InitiativeCategory::SalesMarketing},
        {"gtm", InitiativeCategory::SalesMarketing},
        {"other", InitiativeCategory::Other}
    };

    const std::string key = normalizeLabel(label);
    for (const auto& [alias, category] : aliases)
    {
        if (key == alias)
            return category;
    }
    return std::nullopt;
}

InitiativeCategory inferCategoryFromTitle(const std::string& title)
{
    const std::string t = toLower(title);

    if (containsAny(t, {"vendor", "saas", "software", "tool", "sprawl", "procurement", "contract"}))
        return InitiativeCategory::Vendor;
    if (containsAny(t, {"cloud", "infrastructure", "aws", "azure", "gcp", "hosting"}))
        return InitiativeCategory::Infrastructure;
    if (containsAny(t, {"headcount", "staffing", "workforce", "payroll", "span of control", "hiring"}))
        return InitiativeCategory::Headcount;
    if (containsAny(t, {"sales", "marketing", "cac", "go-to-market"}))
        return InitiativeCategory::SalesMarketing;
    if (containsAny(t, {"pricing", "price", "discount", "monetiz"}))
        return InitiativeCategory::Pricing;
    if (containsAny(t, {"process", "automat", "workflow", "efficiency"}))
        return InitiativeCategory::Process;

    return InitiativeCategory::Other;
}

InitiativeCategory resolveCategory(const std::string& label, const std::string& title)
{
    auto parsed = parseInitiativeCategory(label);
    if (parsed && *parsed != InitiativeCategory::Other)
        return *parsed;

    return inferCategoryFromTitle(title);
}

bool isSoftwareRationalization(const std::string& title)
{
    return containsAny(toLower(title), {"software", "saas", "tool", "sprawl", "licens", "subscription"});
}

bool isSoftwareVendorCategory(const std::string& category)
{
    return containsAny(toLower(category), {"software", "saas"});
}

std::string riskLevelName(RiskLevel level)
{
    switch (level)
    {
    case RiskLevel::Low:
        return "Low";
    case RiskLevel::Med:
        return "Med";
    case RiskLevel::High:
        return "High";
    }
    throw std::invalid_argument("riskLevelName: unknown risk level");
}

} // namespace initiatives
} // namespace ebitdascope
