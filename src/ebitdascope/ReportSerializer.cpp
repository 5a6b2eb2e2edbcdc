#include "ReportSerializer.h"
#include <cmath>
#include <fstream>
#include <vector>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <spdlog/spdlog.h>

using namespace rapidjson;

namespace ebitdascope
{

namespace
{
Value stringValue(const std::string& text, Document::AllocatorType& allocator)
{
    return Value(text.c_str(), static_cast<SizeType>(text.size()), allocator);
}

// Non-finite numbers are not valid JSON
Value numberValue(double value)
{
    Value v;
    if (std::isfinite(value))
        v.SetDouble(value);
    return v;
}

Value monthList(const std::vector<YearMonth>& months, Document::AllocatorType& allocator)
{
    Value list(kArrayType);
    for (const auto& month : months)
        list.PushBack(stringValue(month.toString(), allocator), allocator);
    return list;
}

Value stringList(const std::vector<std::string>& items, Document::AllocatorType& allocator)
{
    Value list(kArrayType);
    for (const auto& item : items)
        list.PushBack(stringValue(item, allocator), allocator);
    return list;
}

Value spikeValue(const SpikeOutlier& spike, Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("month", stringValue(spike.month.toString(), allocator), allocator);
    obj.AddMember("subject", stringValue(spike.subject, allocator), allocator);
    obj.AddMember("value", numberValue(spike.value), allocator);
    obj.AddMember("mean", numberValue(spike.seriesMean), allocator);
    obj.AddMember("stddev", numberValue(spike.seriesStdDev), allocator);
    obj.AddMember("z_score", numberValue(spike.zScore), allocator);
    return obj;
}
} // namespace

Value ReportSerializer::serializePnL(const CanonicalPnL& pnl, Allocator& allocator)
{
    Value months(kArrayType);
    for (const auto& m : pnl.months)
    {
        Value obj(kObjectType);
        obj.AddMember("month", stringValue(m.getMonth().toString(), allocator), allocator);
        obj.AddMember("revenue", numberValue(m.getRevenue()), allocator);
        obj.AddMember("cogs", numberValue(m.getCogs()), allocator);
        for (OpexCategory category : allOpexCategories())
            obj.AddMember(stringValue(opexColumnName(category), allocator),
                          numberValue(m.getOpex(category)), allocator);
        obj.AddMember("gross_margin", numberValue(m.getGrossMargin()), allocator);
        obj.AddMember("gross_margin_pct", numberValue(m.getGrossMarginPct()), allocator);
        obj.AddMember("total_opex", numberValue(m.getTotalOpex()), allocator);
        obj.AddMember("ebitda", numberValue(m.getEbitda()), allocator);
        obj.AddMember("ebitda_margin_pct", numberValue(m.getEbitdaMarginPct()), allocator);
        months.PushBack(obj, allocator);
    }

    Value out(kObjectType);
    out.AddMember("months", months, allocator);
    out.AddMember("zero_revenue_months", monthList(pnl.zeroRevenueMonths, allocator), allocator);
    return out;
}

Value ReportSerializer::serializeOutliers(const OutlierReport& outliers, Allocator& allocator)
{
    Value vendorSpikes(kArrayType);
    for (const auto& spike : outliers.vendorSpikes)
        vendorSpikes.PushBack(spikeValue(spike, allocator), allocator);

    Value opexSpikes(kArrayType);
    for (const auto& spike : outliers.opexSpikes)
        opexSpikes.PushBack(spikeValue(spike, allocator), allocator);

    Value declines(kArrayType);
    for (const auto& decline : outliers.revenueDeclines)
    {
        Value obj(kObjectType);
        obj.AddMember("month", stringValue(decline.month.toString(), allocator), allocator);
        obj.AddMember("prev_month", stringValue(decline.prevMonth.toString(), allocator), allocator);
        obj.AddMember("prev_revenue", numberValue(decline.prevRevenue), allocator);
        obj.AddMember("current_revenue", numberValue(decline.currentRevenue), allocator);
        obj.AddMember("decline_pct", numberValue(decline.declinePct), allocator);
        declines.PushBack(obj, allocator);
    }

    Value out(kObjectType);
    out.AddMember("vendor_spikes", vendorSpikes, allocator);
    out.AddMember("opex_spikes", opexSpikes, allocator);
    out.AddMember("revenue_declines", declines, allocator);
    out.AddMember("insufficient_series", stringList(outliers.insufficientSeries, allocator), allocator);
    return out;
}

Value ReportSerializer::serializeCompleteness(const CompletenessReport& report, Allocator& allocator)
{
    Value out(kObjectType);
    out.AddMember("total_months", static_cast<uint64_t>(report.totalMonths), allocator);
    out.AddMember("missing_gl_months", monthList(report.missingGlMonths, allocator), allocator);
    out.AddMember("missing_payroll_months", monthList(report.missingPayrollMonths, allocator), allocator);
    out.AddMember("zero_revenue_months", monthList(report.zeroRevenueMonths, allocator), allocator);
    out.AddMember("payroll_cost_coverage", numberValue(report.payrollCostCoverage), allocator);
    out.AddMember("month_coverage", numberValue(report.monthCoverage), allocator);
    out.AddMember("dataset_presence", numberValue(report.datasetPresence), allocator);
    out.AddMember("completeness_score", numberValue(report.completenessScore), allocator);
    out.AddMember("has_payroll", report.hasPayroll, allocator);
    out.AddMember("has_vendor", report.hasVendor, allocator);
    out.AddMember("has_segments", report.hasSegments, allocator);

    Value counts(kObjectType);
    counts.AddMember("gl", static_cast<uint64_t>(report.glRecords), allocator);
    counts.AddMember("payroll", static_cast<uint64_t>(report.payrollRecords), allocator);
    counts.AddMember("vendor", static_cast<uint64_t>(report.vendorRecords), allocator);
    counts.AddMember("segments", static_cast<uint64_t>(report.segmentRecords), allocator);
    out.AddMember("record_counts", counts, allocator);

    out.AddMember("insufficient_data", stringList(report.insufficientData, allocator), allocator);
    out.AddMember("data_gaps", stringList(report.dataGaps, allocator), allocator);
    return out;
}

Value ReportSerializer::serializeDiagnostics(const DiagnosticsBundle& bundle, Allocator& allocator)
{
    Value bridge(kArrayType);
    for (const auto& entry : bundle.getMarginBridge())
    {
        Value obj(kObjectType);
        obj.AddMember("month", stringValue(entry.month.toString(), allocator), allocator);
        obj.AddMember("prev_month", stringValue(entry.prevMonth.toString(), allocator), allocator);
        obj.AddMember("revenue_impact", numberValue(entry.revenueImpact), allocator);
        obj.AddMember("cogs_impact", numberValue(entry.cogsImpact), allocator);
        obj.AddMember("opex_impact", numberValue(entry.opexImpact), allocator);
        obj.AddMember("ebitda_change", numberValue(entry.ebitdaChange), allocator);
        obj.AddMember("revenue_flowthrough", numberValue(entry.revenueFlowthrough), allocator);
        bridge.PushBack(obj, allocator);
    }

    Value trends(kArrayType);
    for (const auto& trend : bundle.getTrends())
    {
        Value obj(kObjectType);
        obj.AddMember("metric", stringValue(trendMetricName(trend.metric), allocator), allocator);
        obj.AddMember("points", static_cast<uint64_t>(trend.points), allocator);
        obj.AddMember("available", trend.isAvailable(), allocator);
        if (trend.estimate)
        {
            obj.AddMember("slope", numberValue(trend.estimate->slope), allocator);
            obj.AddMember("intercept", numberValue(trend.estimate->intercept), allocator);
            obj.AddMember("r_squared", numberValue(trend.estimate->rSquared), allocator);
            obj.AddMember("direction", stringValue(trendDirectionName(trend.estimate->direction), allocator),
                          allocator);
        }
        trends.PushBack(obj, allocator);
    }

    Value splits(kArrayType);
    for (const auto& split : bundle.getCostSplits())
    {
        Value obj(kObjectType);
        obj.AddMember("category", stringValue(opexCategoryName(split.category), allocator), allocator);
        Value correlation;
        if (split.correlation)
            correlation = numberValue(*split.correlation);
        obj.AddMember("correlation", correlation, allocator);
        obj.AddMember("variable_pct", numberValue(split.variablePct), allocator);
        obj.AddMember("fixed_pct", numberValue(split.fixedPct), allocator);
        obj.AddMember("confidence", numberValue(split.confidence), allocator);
        obj.AddMember("months_available", static_cast<uint64_t>(split.monthsAvailable), allocator);
        obj.AddMember("insufficient_data", split.insufficientData, allocator);
        splits.PushBack(obj, allocator);
    }

    Value out(kObjectType);
    out.AddMember("margin_bridge", bridge, allocator);
    out.AddMember("outliers", serializeOutliers(bundle.getOutliers(), allocator), allocator);
    out.AddMember("trends", trends, allocator);
    out.AddMember("cost_splits", splits, allocator);
    out.AddMember("completeness", serializeCompleteness(bundle.getCompleteness(), allocator), allocator);
    return out;
}

Value ReportSerializer::serializeInitiative(const initiatives::RankedInitiative& ranked, Allocator& allocator)
{
    const initiatives::SizedInitiative& sized = ranked.initiative;

    Value obj(kObjectType);
    obj.AddMember("rank", ranked.rank, allocator);
    obj.AddMember("title", stringValue(sized.hypothesis.title, allocator), allocator);
    obj.AddMember("category",
                  stringValue(initiatives::initiativeCategoryName(sized.hypothesis.category), allocator),
                  allocator);
    obj.AddMember("description", stringValue(sized.hypothesis.description, allocator), allocator);
    obj.AddMember("impact_low", numberValue(sized.impactLow), allocator);
    obj.AddMember("impact_high", numberValue(sized.impactHigh), allocator);
    obj.AddMember("impact_mid", numberValue(sized.impactMid()), allocator);
    obj.AddMember("implementation_cost_estimate", numberValue(sized.implementationCostEstimate), allocator);
    obj.AddMember("time_to_value_weeks", sized.timeToValueWeeks, allocator);
    obj.AddMember("risk_level", stringValue(initiatives::riskLevelName(sized.riskLevel), allocator), allocator);
    obj.AddMember("confidence", numberValue(sized.confidence), allocator);
    obj.AddMember("needs_data", sized.needsData, allocator);
    obj.AddMember("weighted_score", numberValue(ranked.weightedScore), allocator);
    obj.AddMember("assumptions", stringList(sized.assumptions, allocator), allocator);
    obj.AddMember("next_steps", stringList(sized.nextSteps, allocator), allocator);
    return obj;
}

std::string ReportSerializer::toJson(const initiatives::AnalysisResult& result,
                                     const initiatives::CompanyContext& context)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value metadata(kObjectType);
    metadata.AddMember("version", "1.0", allocator);
    metadata.AddMember("company", stringValue(context.companyName, allocator), allocator);
    metadata.AddMember("industry", stringValue(context.industry, allocator), allocator);
    metadata.AddMember("months", static_cast<uint64_t>(result.getPnL().size()), allocator);
    doc.AddMember("metadata", metadata, allocator);

    doc.AddMember("pnl", serializePnL(result.getPnL(), allocator), allocator);
    doc.AddMember("diagnostics", serializeDiagnostics(result.getDiagnostics(), allocator), allocator);

    Value initiativesJson(kArrayType);
    for (const auto& ranked : result.getRankedInitiatives())
        initiativesJson.PushBack(serializeInitiative(ranked, allocator), allocator);
    doc.AddMember("initiatives", initiativesJson, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

bool ReportSerializer::saveToFile(const initiatives::AnalysisResult& result,
                                  const initiatives::CompanyContext& context,
                                  const std::string& filePath)
{
    std::ofstream file(filePath);
    if (!file.is_open())
    {
        spdlog::error("Cannot open file for writing: {}", filePath);
        return false;
    }

    file << toJson(result, context) << '\n';
    return static_cast<bool>(file);
}

} // namespace ebitdascope
