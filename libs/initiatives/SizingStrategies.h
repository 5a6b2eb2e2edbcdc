#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "DiagnosticsBundle.h"
#include "InitiativeTypes.h"
#include "InputRecords.h"
#include "PnLReconstructor.h"

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Tunables shared by all sizing strategies.
 */
struct SizingConfig
{
    double confidenceFloor = 0.2;
    double confidenceCeiling = 0.9;
    double fallbackWidening = 1.5;          ///< band multiplier when data is missing (>= 1.5)
    double fallbackConfidencePull = 0.25;   ///< fraction of (nominal - floor) kept on fallback
    double roundingUnit = 1000.0;           ///< impacts rounded to this unit; <= 0 disables
    std::size_t trailingMonths = 12;
    std::size_t minHistoryMonths = 3;       ///< shorter windows are sized at reduced confidence
    std::size_t topEntries = 5;             ///< vendors / segments named in assumptions
    double genericLowPct = 0.005;
    double genericHighPct = 0.015;
};

/**
 * @brief Read-only data a strategy may consult. Optional datasets are empty
 * vectors when not supplied.
 */
struct SizingInputs
{
    const CanonicalPnL& pnl;
    const DiagnosticsBundle& diagnostics;
    const std::vector<PayrollRecord>& payroll;
    const std::vector<VendorRecord>& vendors;
    const std::vector<SegmentRecord>& segments;
};

/**
 * @brief Unrounded estimate produced by one strategy.
 */
struct SizingEstimate
{
    double impactLow = 0.0;
    double impactHigh = 0.0;
    double implementationCost = 0.0;
    unsigned int timeToValueWeeks = 12;
    RiskLevel riskLevel = RiskLevel::Med;
    double confidence = 0.2;
    std::size_t monthsOfHistory = 0;        ///< distinct months behind the base amount
    std::vector<std::string> assumptions;
    std::vector<std::string> nextSteps;
};

//
// One strategy per category. estimate() returns empty when the data the
// strategy needs is absent; the sizer then applies the generic fallback
// using the strategy's nominal risk, time to value and confidence.
//

struct VendorSizing
{
    static constexpr const char* requiredData = "vendor spend";
    static constexpr RiskLevel nominalRisk = RiskLevel::Low;
    static constexpr unsigned int nominalWeeks = 8;
    static constexpr double nominalConfidence = 0.5;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

/**
 * @brief Tool sprawl: only vendors whose category names software or SaaS.
 */
struct SoftwareRationalizationSizing
{
    static constexpr const char* requiredData = "software vendor spend";
    static constexpr RiskLevel nominalRisk = RiskLevel::Low;
    static constexpr unsigned int nominalWeeks = 8;
    static constexpr double nominalConfidence = 0.7;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

struct HeadcountSizing
{
    static constexpr const char* requiredData = "payroll cost";
    static constexpr RiskLevel nominalRisk = RiskLevel::High;
    static constexpr unsigned int nominalWeeks = 24;
    static constexpr double nominalConfidence = 0.5;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

struct PricingSizing
{
    static constexpr const char* requiredData = "revenue by segment";
    static constexpr RiskLevel nominalRisk = RiskLevel::Med;
    static constexpr unsigned int nominalWeeks = 12;
    static constexpr double nominalConfidence = 0.5;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

struct ProcessSizing
{
    static constexpr const char* requiredData = "cost structure history (3+ months)";
    static constexpr RiskLevel nominalRisk = RiskLevel::Med;
    static constexpr unsigned int nominalWeeks = 16;
    static constexpr double nominalConfidence = 0.5;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

struct InfrastructureSizing
{
    static constexpr const char* requiredData = "other operating expense";
    static constexpr RiskLevel nominalRisk = RiskLevel::Med;
    static constexpr unsigned int nominalWeeks = 16;
    static constexpr double nominalConfidence = 0.6;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

struct SalesMarketingSizing
{
    static constexpr const char* requiredData = "sales & marketing expense";
    static constexpr RiskLevel nominalRisk = RiskLevel::Med;
    static constexpr unsigned int nominalWeeks = 12;
    static constexpr double nominalConfidence = 0.6;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

/**
 * @brief Revenue-scale heuristic. Sizes Other-category initiatives and is the
 * base of every fallback.
 */
struct GenericSizing
{
    static constexpr const char* requiredData = "general ledger revenue";
    static constexpr RiskLevel nominalRisk = RiskLevel::Med;
    static constexpr unsigned int nominalWeeks = 16;
    static constexpr double nominalConfidence = 0.4;

    std::optional<SizingEstimate> estimate(const SizingInputs& in, const SizingConfig& config) const;
};

using SizingStrategy = std::variant<VendorSizing,
                                    SoftwareRationalizationSizing,
                                    HeadcountSizing,
                                    PricingSizing,
                                    ProcessSizing,
                                    InfrastructureSizing,
                                    SalesMarketingSizing,
                                    GenericSizing>;

SizingStrategy strategyFor(InitiativeCategory category);

/**
 * @brief Category dispatch, except that Vendor hypotheses whose title is about
 * software or tool sprawl get SoftwareRationalizationSizing.
 */
SizingStrategy strategyFor(const InitiativeHypothesis& hypothesis);

/**
 * @brief Average monthly value over the trailing window times 12.
 *
 * Uses at most config.trailingMonths of the most recent canonical months;
 * 0 when the series is empty.
 */
template <typename MonthValue>
double annualizedTrailing(const CanonicalPnL& pnl, std::size_t trailingMonths, MonthValue value)
{
    if (pnl.empty() || trailingMonths == 0)
        return 0.0;

    const std::size_t n = std::min(trailingMonths, pnl.size());
    double sum = 0.0;
    for (std::size_t i = pnl.size() - n; i < pnl.size(); ++i)
        sum += value(pnl.months[i]);

    return sum / static_cast<double>(n) * 12.0;
}

/**
 * @brief "$1,250,000" style formatting used in assumption text.
 */
std::string formatCurrency(double amount);

} // namespace initiatives
} // namespace ebitdascope
