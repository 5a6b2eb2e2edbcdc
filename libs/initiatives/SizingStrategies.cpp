#include "SizingStrategies.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace ebitdascope
{
namespace initiatives
{

namespace
{
/**
 * @brief Per-key totals over the trailing window of a month-keyed dataset,
 * scaled to a 12-month figure.
 */
struct TrailingTotals
{
    std::map<std::string, double> annualByKey;
    double annualTotal = 0.0;
    std::size_t monthsCovered = 0;
};

template <typename Record, typename KeyFn, typename AmountFn>
TrailingTotals trailingTotals(const std::vector<Record>& records, std::size_t trailingMonths,
                              KeyFn key, AmountFn amount)
{
    TrailingTotals totals;
    if (records.empty() || trailingMonths == 0)
        return totals;

    YearMonth latest = records.front().month;
    for (const auto& rec : records)
        latest = std::max(latest, rec.month);

    std::set<YearMonth> monthsInWindow;
    for (const auto& rec : records)
    {
        const long age = rec.month.monthsUntil(latest);
        if (age < 0 || age >= static_cast<long>(trailingMonths))
            continue;

        monthsInWindow.insert(rec.month);
        totals.annualByKey[key(rec)] += amount(rec);
    }

    totals.monthsCovered = monthsInWindow.size();
    const double scale = 12.0 / static_cast<double>(totals.monthsCovered);
    for (auto& [name, value] : totals.annualByKey)
    {
        value *= scale;
        totals.annualTotal += value;
    }
    return totals;
}

// Largest entries first, ties by name
std::vector<std::pair<std::string, double>> topEntries(const std::map<std::string, double>& byKey,
                                                       std::size_t count)
{
    std::vector<std::pair<std::string, double>> entries(byKey.begin(), byKey.end());
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
    if (entries.size() > count)
        entries.resize(count);
    return entries;
}

std::string describeEntries(const std::vector<std::pair<std::string, double>>& entries)
{
    std::string text;
    for (const auto& [name, value] : entries)
    {
        if (!text.empty())
            text += ", ";
        text += name + " (" + formatCurrency(value) + ")";
    }
    return text;
}

std::string percentRange(double low, double high)
{
    std::ostringstream oss;
    oss << std::defaultfloat << low * 100.0 << "-" << high * 100.0 << "%";
    return oss.str();
}

// Canonical months inside the trailing window
std::size_t trailingPnLMonths(const CanonicalPnL& pnl, std::size_t trailingMonths)
{
    return std::min(trailingMonths, pnl.size());
}

SizingEstimate bandEstimate(double base, double lowPct, double highPct, double implementationPct,
                            unsigned int weeks, RiskLevel risk, double confidence)
{
    SizingEstimate est;
    est.impactLow = base * lowPct;
    est.impactHigh = base * highPct;
    est.implementationCost = base * implementationPct;
    est.timeToValueWeeks = weeks;
    est.riskLevel = risk;
    est.confidence = confidence;
    return est;
}
} // namespace

std::string formatCurrency(double amount)
{
    const long long whole = std::llround(std::fabs(amount));
    std::string digits = std::to_string(whole);

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        if (count > 0 && count % 3 == 0)
            grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    return (amount < 0.0 && whole != 0 ? "-$" : "$") + grouped;
}

std::optional<SizingEstimate> VendorSizing::estimate(const SizingInputs& in,
                                                     const SizingConfig& config) const
{
    constexpr double lowPct = 0.05;
    constexpr double highPct = 0.15;

    auto totals = trailingTotals(in.vendors, config.trailingMonths,
                                 [](const VendorRecord& r) { return r.vendor; },
                                 [](const VendorRecord& r) { return r.amount; });
    if (!(totals.annualTotal > 0.0))
        return std::nullopt;

    const std::size_t vendorCount = totals.annualByKey.size();
    SizingEstimate est = bandEstimate(totals.annualTotal, lowPct, highPct, 0.02,
                                      nominalWeeks, nominalRisk,
                                      vendorCount > 10 ? 0.7 : nominalConfidence);
    est.monthsOfHistory = totals.monthsCovered;

    est.assumptions.push_back("Annualized vendor spend of " + formatCurrency(totals.annualTotal)
                              + " across " + std::to_string(vendorCount) + " vendor(s) over the last "
                              + std::to_string(totals.monthsCovered) + " month(s)");
    est.assumptions.push_back("Top vendors: " + describeEntries(topEntries(totals.annualByKey,
                                                                           config.topEntries)));
    est.assumptions.push_back("Consolidation and renegotiation save " + percentRange(lowPct, highPct)
                              + " of addressable spend");
    est.nextSteps = {"Inventory all vendor contracts and renewal dates",
                     "Identify overlapping vendors as consolidation candidates",
                     "Prioritize renegotiation with the largest vendors"};
    return est;
}

std::optional<SizingEstimate> SoftwareRationalizationSizing::estimate(const SizingInputs& in,
                                                                      const SizingConfig& config) const
{
    constexpr double lowPct = 0.15;
    constexpr double highPct = 0.25;

    std::vector<VendorRecord> software;
    std::copy_if(in.vendors.begin(), in.vendors.end(), std::back_inserter(software),
                 [](const VendorRecord& r) { return isSoftwareVendorCategory(r.category); });

    auto totals = trailingTotals(software, config.trailingMonths,
                                 [](const VendorRecord& r) { return r.vendor; },
                                 [](const VendorRecord& r) { return r.amount; });
    if (!(totals.annualTotal > 0.0))
        return std::nullopt;

    SizingEstimate est = bandEstimate(totals.annualTotal, lowPct, highPct, 0.03,
                                      nominalWeeks, nominalRisk, nominalConfidence);
    est.monthsOfHistory = totals.monthsCovered;

    est.assumptions.push_back(std::to_string(totals.annualByKey.size()) + " software vendor(s) with "
                              + formatCurrency(totals.annualTotal) + " annualized spend over the last "
                              + std::to_string(totals.monthsCovered) + " month(s)");
    est.assumptions.push_back("Largest tools: " + describeEntries(topEntries(totals.annualByKey,
                                                                             config.topEntries)));
    est.assumptions.push_back("Retiring unused seats and overlapping tools saves "
                              + percentRange(lowPct, highPct) + " of software spend");
    est.nextSteps = {"Build a software inventory with owners and renewal dates",
                     "Pull seat usage from SSO and admin consoles",
                     "Cancel or downgrade tools with overlapping function"};
    return est;
}

std::optional<SizingEstimate> HeadcountSizing::estimate(const SizingInputs& in,
                                                        const SizingConfig& config) const
{
    constexpr double lowPct = 0.05;
    constexpr double highPct = 0.10;

    // Latest month that carries fully loaded cost
    std::optional<YearMonth> latest;
    std::set<YearMonth> costedMonths;
    for (const auto& rec : in.payroll)
    {
        if (!rec.fullyLoadedCost)
            continue;

        costedMonths.insert(rec.month);
        if (!latest || *latest < rec.month)
            latest = rec.month;
    }
    if (!latest)
        return std::nullopt;

    std::map<std::string, double> annualCostByFunction;
    double annualCost = 0.0;
    unsigned long headcount = 0;
    for (const auto& rec : in.payroll)
    {
        if (rec.month != *latest)
            continue;

        // heads without a cost would dilute the cost per head
        if (!rec.fullyLoadedCost)
            continue;

        headcount += rec.headcount;
        annualCostByFunction[payrollFunctionName(rec.function)] += *rec.fullyLoadedCost * 12.0;
        annualCost += *rec.fullyLoadedCost * 12.0;
    }
    if (!(annualCost > 0.0))
        return std::nullopt;

    const double costPerHead = headcount > 0 ? annualCost / static_cast<double>(headcount) : 0.0;

    SizingEstimate est = bandEstimate(annualCost, lowPct, highPct, 0.0,
                                      nominalWeeks, nominalRisk, nominalConfidence);
    est.implementationCost = costPerHead * 0.5;
    est.monthsOfHistory = std::min(costedMonths.size(), config.trailingMonths);

    est.assumptions.push_back("Annualized fully loaded payroll of " + formatCurrency(annualCost)
                              + " for " + std::to_string(headcount) + " costed employee(s) as of "
                              + latest->toString());
    est.assumptions.push_back("Cost by function: " + describeEntries(topEntries(annualCostByFunction,
                                                                                annualCostByFunction.size())));
    est.assumptions.push_back("Efficiency program removes " + percentRange(lowPct, highPct)
                              + " of fully loaded cost");
    est.assumptions.push_back("Transition cost of half a year's average cost per head");
    est.nextSteps = {"Workforce analysis by function and span of control",
                     "Identify roles for consolidation, automation or attrition",
                     "Model severance and transition timeline"};
    return est;
}

std::optional<SizingEstimate> PricingSizing::estimate(const SizingInputs& in,
                                                      const SizingConfig& config) const
{
    constexpr double lowPct = 0.01;
    constexpr double highPct = 0.03;

    auto totals = trailingTotals(in.segments, config.trailingMonths,
                                 [](const SegmentRecord& r) { return r.segment; },
                                 [](const SegmentRecord& r) { return r.revenue; });
    if (!(totals.annualTotal > 0.0))
        return std::nullopt;

    SizingEstimate est = bandEstimate(totals.annualTotal, lowPct, highPct, 0.005,
                                      nominalWeeks, nominalRisk, nominalConfidence);
    est.monthsOfHistory = totals.monthsCovered;

    est.assumptions.push_back("Annualized segment revenue of " + formatCurrency(totals.annualTotal)
                              + " across " + std::to_string(totals.annualByKey.size()) + " segment(s)");
    est.assumptions.push_back("Largest segments: " + describeEntries(topEntries(totals.annualByKey,
                                                                                config.topEntries)));
    est.assumptions.push_back("Price realization improves by " + percentRange(lowPct, highPct)
                              + " with no volume loss");
    est.nextSteps = {"Analyze discounting and price realization by segment",
                     "Test list-price changes on the largest segments"};
    return est;
}

std::optional<SizingEstimate> ProcessSizing::estimate(const SizingInputs& in,
                                                      const SizingConfig& config) const
{
    constexpr double lowPct = 0.03;
    constexpr double highPct = 0.08;

    double variableOpex = 0.0;
    double confidenceSum = 0.0;
    for (OpexCategory category : allOpexCategories())
    {
        auto split = in.diagnostics.findCostSplit(category);
        if (!split || split->insufficientData)
            return std::nullopt;

        const double annual = annualizedTrailing(in.pnl, config.trailingMonths,
                                                 [category](const MonthlyFinancials& m) {
                                                     return m.getOpex(category);
                                                 });
        variableOpex += annual * split->variablePct / 100.0;
        confidenceSum += split->confidence;
    }
    if (!(variableOpex > 0.0))
        return std::nullopt;

    SizingEstimate est = bandEstimate(variableOpex, lowPct, highPct, 0.02,
                                      nominalWeeks, nominalRisk,
                                      confidenceSum / static_cast<double>(kNumOpexCategories));
    est.monthsOfHistory = trailingPnLMonths(in.pnl, config.trailingMonths);

    est.assumptions.push_back("Variable share of annualized opex is " + formatCurrency(variableOpex)
                              + " based on revenue correlation");
    est.assumptions.push_back("Process improvement removes " + percentRange(lowPct, highPct)
                              + " of variable operating cost");
    est.nextSteps = {"Map the highest-volume workflows",
                     "Identify automation candidates in variable cost areas"};
    return est;
}

std::optional<SizingEstimate> InfrastructureSizing::estimate(const SizingInputs& in,
                                                             const SizingConfig& config) const
{
    constexpr double lowPct = 0.10;
    constexpr double highPct = 0.25;

    const double annualOther = annualizedTrailing(in.pnl, config.trailingMonths,
                                                  [](const MonthlyFinancials& m) {
                                                      return m.getOpex(OpexCategory::Other);
                                                  });
    if (!(annualOther > 0.0))
        return std::nullopt;

    SizingEstimate est = bandEstimate(annualOther, lowPct, highPct, 0.05,
                                      nominalWeeks, nominalRisk, nominalConfidence);
    est.monthsOfHistory = trailingPnLMonths(in.pnl, config.trailingMonths);

    est.assumptions.push_back("Infrastructure spend is carried in other opex ("
                              + formatCurrency(annualOther) + " annualized)");
    est.assumptions.push_back("Right-sizing and commitments save " + percentRange(lowPct, highPct));
    est.nextSteps = {"Right-size instances and storage", "Reserved capacity and commitment analysis"};
    return est;
}

std::optional<SizingEstimate> SalesMarketingSizing::estimate(const SizingInputs& in,
                                                             const SizingConfig& config) const
{
    constexpr double lowPct = 0.10;
    constexpr double highPct = 0.20;

    const double annualSm = annualizedTrailing(in.pnl, config.trailingMonths,
                                               [](const MonthlyFinancials& m) {
                                                   return m.getOpex(OpexCategory::SalesMarketing);
                                               });
    if (!(annualSm > 0.0))
        return std::nullopt;

    SizingEstimate est = bandEstimate(annualSm, lowPct, highPct, 0.05,
                                      nominalWeeks, nominalRisk, nominalConfidence);
    est.monthsOfHistory = trailingPnLMonths(in.pnl, config.trailingMonths);

    est.assumptions.push_back("Annualized sales & marketing spend of " + formatCurrency(annualSm));
    est.assumptions.push_back("Channel and program efficiency improves " + percentRange(lowPct, highPct));
    est.nextSteps = {"CAC and payback analysis by channel", "Reallocate spend from the weakest channels"};
    return est;
}

std::optional<SizingEstimate> GenericSizing::estimate(const SizingInputs& in,
                                                      const SizingConfig& config) const
{
    const double annualRevenue = annualizedTrailing(in.pnl, config.trailingMonths,
                                                    [](const MonthlyFinancials& m) {
                                                        return m.getRevenue();
                                                    });
    if (!(annualRevenue > 0.0))
        return std::nullopt;

    const double annualEbitda = annualizedTrailing(in.pnl, config.trailingMonths,
                                                   [](const MonthlyFinancials& m) {
                                                       return m.getEbitda();
                                                   });

    SizingEstimate est = bandEstimate(annualRevenue, config.genericLowPct, config.genericHighPct, 0.0,
                                      nominalWeeks, nominalRisk, nominalConfidence);
    est.implementationCost = (est.impactLow + est.impactHigh) / 2.0 * 0.1;
    est.monthsOfHistory = trailingPnLMonths(in.pnl, config.trailingMonths);

    est.assumptions.push_back("Generic estimate of " + percentRange(config.genericLowPct, config.genericHighPct)
                              + " of annualized revenue (" + formatCurrency(annualRevenue) + ")");
    est.assumptions.push_back("Annualized EBITDA of " + formatCurrency(annualEbitda));
    auto revenueTrend = in.diagnostics.findTrend(TrendMetric::Revenue);
    if (revenueTrend && revenueTrend->isAvailable())
        est.assumptions.push_back("Revenue trend is " + trendDirectionName(revenueTrend->estimate->direction)
                                  + " over " + std::to_string(revenueTrend->points) + " month(s)");
    est.nextSteps = {"Detailed analysis required to size this initiative"};
    return est;
}

SizingStrategy strategyFor(InitiativeCategory category)
{
    switch (category)
    {
    case InitiativeCategory::Vendor:
        return VendorSizing{};
    case InitiativeCategory::Headcount:
        return HeadcountSizing{};
    case InitiativeCategory::Pricing:
        return PricingSizing{};
    case InitiativeCategory::Process:
        return ProcessSizing{};
    case InitiativeCategory::Infrastructure:
        return InfrastructureSizing{};
    case InitiativeCategory::SalesMarketing:
        return SalesMarketingSizing{};
    case InitiativeCategory::Other:
        return GenericSizing{};
    }
    return GenericSizing{};
}

SizingStrategy strategyFor(const InitiativeHypothesis& hypothesis)
{
    if (hypothesis.category == InitiativeCategory::Vendor && isSoftwareRationalization(hypothesis.title))
        return SoftwareRationalizationSizing{};

    return strategyFor(hypothesis.category);
}

} // namespace initiatives
} // namespace ebitdascope
