#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Sizing category of an improvement initiative.
 *
 * Each value has exactly one sizing strategy; Other is sized with the
 * generic revenue-scale heuristic.
 */
enum class InitiativeCategory
{
    Vendor,
    Headcount,
    Pricing,
    Process,
    Infrastructure,
    SalesMarketing,
    Other
};

enum class RiskLevel
{
    Low,
    Med,
    High
};

/**
 * @brief An externally proposed initiative. Carries no numbers.
 */
struct InitiativeHypothesis
{
    std::string title;
    InitiativeCategory category = InitiativeCategory::Other;
    std::string description;
};

/**
 * @brief Free-text company signals. Reported alongside estimates, never used
 * in arithmetic.
 */
struct CompanyContext
{
    std::string companyName;
    std::string industry;
    std::string notes;

    bool empty() const
    {
        return companyName.empty() && industry.empty() && notes.empty();
    }
};

/**
 * @brief A hypothesis with a deterministic, annualized impact estimate.
 *
 * Invariants: 0 <= impactLow <= impactHigh, implementationCostEstimate >= 0,
 * timeToValueWeeks > 0, confidence in [0.2, 0.9].
 */
struct SizedInitiative
{
    InitiativeHypothesis hypothesis;
    double impactLow = 0.0;
    double impactHigh = 0.0;
    double implementationCostEstimate = 0.0;
    unsigned int timeToValueWeeks = 12;
    RiskLevel riskLevel = RiskLevel::Med;
    double confidence = 0.2;
    bool needsData = false;
    std::vector<std::string> assumptions;
    std::vector<std::string> nextSteps;

    double impactMid() const
    {
        return (impactLow + impactHigh) / 2.0;
    }

    const std::string& title() const
    {
        return hypothesis.title;
    }
};

struct RankedInitiative
{
    SizedInitiative initiative;
    double weightedScore = 0.0;
    unsigned int rank = 0;      ///< 1-based
};

std::string initiativeCategoryName(InitiativeCategory category);

/**
 * @brief Parse a category label, case-insensitively.
 *
 * Accepts the enum names and common aliases ("SaaS", "Software" -> Vendor,
 * "Cloud" -> Infrastructure, "Sales & Marketing" -> SalesMarketing, ...).
 * Returns empty for labels that do not name a sizing category.
 */
std::optional<InitiativeCategory> parseInitiativeCategory(const std::string& label);

/**
 * @brief Keyword-based category inference from an initiative title.
 */
InitiativeCategory inferCategoryFromTitle(const std::string& title);

/**
 * @brief Category for a hypothesis: the label when it parses, otherwise the
 * title inference.
 */
InitiativeCategory resolveCategory(const std::string& label, const std::string& title);

// Title is about software licences or tool sprawl
bool isSoftwareRationalization(const std::string& title);

// Vendor category label names software or SaaS, case-insensitively
bool isSoftwareVendorCategory(const std::string& category);

std::string riskLevelName(RiskLevel level);

} // namespace initiatives
} // namespace ebitdascope
