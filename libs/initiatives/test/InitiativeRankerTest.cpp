#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include "InitiativeRanker.h"

using namespace ebitdascope::initiatives;
using Catch::Approx;

namespace
{
    SizedInitiative makeSized(const std::string& title, double low, double high, double confidence,
                              RiskLevel risk, unsigned int weeks)
    {
        SizedInitiative sized;
        sized.hypothesis.title = title;
        sized.impactLow = low;
        sized.impactHigh = high;
        sized.confidence = confidence;
        sized.riskLevel = risk;
        sized.timeToValueWeeks = weeks;
        return sized;
    }
}

TEST_CASE("InitiativeRanker orders by weighted score", "[InitiativeRanker]")
{
    InitiativeRanker ranker;

    SECTION("Reference pair")
    {
        auto a = makeSized("A", 100000.0, 200000.0, 0.7, RiskLevel::Low, 8);
        auto b = makeSized("B", 150000.0, 150000.0, 0.5, RiskLevel::High, 20);

        auto ranked = ranker.rank({b, a});
        REQUIRE(ranked.size() == 2);
        REQUIRE(ranked[0].initiative.title() == "A");
        REQUIRE(ranked[0].rank == 1);
        REQUIRE(ranked[1].initiative.title() == "B");
        REQUIRE(ranked[1].rank == 2);
        REQUIRE(ranked[0].weightedScore == Approx(150000.0 * 0.7 / (1.0 * 1.08)));
        REQUIRE(ranked[1].weightedScore == Approx(150000.0 * 0.5 / (1.5 * 1.2)));
        REQUIRE(ranked[0].weightedScore > ranked[1].weightedScore);
    }

    SECTION("Empty input")
    {
        REQUIRE(ranker.rank({}).empty());
    }

    SECTION("Ranks are dense and start at 1")
    {
        std::vector<SizedInitiative> sized;
        for (int i = 0; i < 5; ++i)
            sized.push_back(makeSized("I" + std::to_string(i), 1000.0 * i, 1000.0 * (i + 1), 0.5,
                                      RiskLevel::Med, 12));

        auto ranked = ranker.rank(sized);
        for (std::size_t i = 0; i < ranked.size(); ++i)
            REQUIRE(ranked[i].rank == i + 1);
        REQUIRE(ranked.front().initiative.title() == "I4");
    }

    SECTION("Equal scores fall back to impact mid-point, then title")
    {
        auto wide = makeSized("Wide", 200000.0, 200000.0, 0.25, RiskLevel::Med, 12);
        auto narrow = makeSized("Narrow", 100000.0, 100000.0, 0.5, RiskLevel::Med, 12);
        auto beta = makeSized("Beta", 100000.0, 100000.0, 0.5, RiskLevel::Med, 12);
        auto alpha = makeSized("Alpha", 100000.0, 100000.0, 0.5, RiskLevel::Med, 12);

        auto ranked = ranker.rank({beta, narrow, alpha, wide});
        REQUIRE(ranked[0].initiative.title() == "Wide");
        REQUIRE(ranked[1].initiative.title() == "Alpha");
        REQUIRE(ranked[2].initiative.title() == "Beta");
        REQUIRE(ranked[3].initiative.title() == "Narrow");
    }

    SECTION("Order does not depend on input order")
    {
        std::vector<SizedInitiative> sized{
            makeSized("Vendor", 50000.0, 90000.0, 0.5, RiskLevel::Low, 8),
            makeSized("Pricing", 20000.0, 60000.0, 0.5, RiskLevel::Med, 12),
            makeSized("Headcount", 90000.0, 180000.0, 0.5, RiskLevel::High, 24),
            makeSized("Other", 6000.0, 18000.0, 0.4, RiskLevel::Med, 16)
        };
        std::vector<SizedInitiative> reversed(sized.rbegin(), sized.rend());

        auto first = ranker.rank(sized);
        auto second = ranker.rank(reversed);
        for (std::size_t i = 0; i < first.size(); ++i)
        {
            REQUIRE(first[i].initiative.title() == second[i].initiative.title());
            REQUIRE(first[i].weightedScore == second[i].weightedScore);
        }
    }

    SECTION("Repeated titles are ordered by category, then description")
    {
        auto fromFirstRun = makeSized("Renegotiate contracts", 100000.0, 100000.0, 0.5, RiskLevel::Med, 12);
        fromFirstRun.hypothesis.description = "Largest three vendors";
        auto fromSecondRun = fromFirstRun;
        fromSecondRun.hypothesis.description = "All vendors over $50k";
        auto asPricing = fromFirstRun;
        asPricing.hypothesis.category = InitiativeCategory::Pricing;

        auto forward = ranker.rank({fromFirstRun, fromSecondRun, asPricing});
        auto backward = ranker.rank({asPricing, fromSecondRun, fromFirstRun});

        // "Other" sorts before "Pricing"; "All..." before "Largest..."
        REQUIRE(forward[0].initiative.hypothesis.description == "All vendors over $50k");
        REQUIRE(forward[1].initiative.hypothesis.description == "Largest three vendors");
        REQUIRE(forward[2].initiative.hypothesis.category == InitiativeCategory::Pricing);
        for (std::size_t i = 0; i < forward.size(); ++i)
        {
            REQUIRE(forward[i].rank == backward[i].rank);
            REQUIRE(forward[i].initiative.hypothesis.description
                    == backward[i].initiative.hypothesis.description);
            REQUIRE(forward[i].initiative.hypothesis.category == backward[i].initiative.hypothesis.category);
        }
    }

    SECTION("Same title, description and mid-point still order by the band")
    {
        auto narrow = makeSized("Renegotiate contracts", 100000.0, 100000.0, 0.5, RiskLevel::Med, 12);
        auto wide = makeSized("Renegotiate contracts", 50000.0, 150000.0, 0.5, RiskLevel::Med, 12);

        auto forward = ranker.rank({narrow, wide});
        auto backward = ranker.rank({wide, narrow});
        REQUIRE(forward[0].initiative.impactLow == 50000.0);
        REQUIRE(backward[0].initiative.impactLow == 50000.0);
    }
}

TEST_CASE("InitiativeRanker score is monotone in each input", "[InitiativeRanker]")
{
    InitiativeRanker ranker;
    auto base = makeSized("Base", 100000.0, 200000.0, 0.5, RiskLevel::Med, 12);
    const double baseScore = ranker.score(base);

    auto higherImpact = base;
    higherImpact.impactHigh = 300000.0;
    REQUIRE(ranker.score(higherImpact) > baseScore);

    auto higherConfidence = base;
    higherConfidence.confidence = 0.6;
    REQUIRE(ranker.score(higherConfidence) > baseScore);

    auto higherRisk = base;
    higherRisk.riskLevel = RiskLevel::High;
    REQUIRE(ranker.score(higherRisk) < baseScore);

    auto lowerRisk = base;
    lowerRisk.riskLevel = RiskLevel::Low;
    REQUIRE(ranker.score(lowerRisk) > baseScore);

    auto slower = base;
    slower.timeToValueWeeks = 20;
    REQUIRE(ranker.score(slower) < baseScore);

    RankingConfiguration heavierRisk;
    heavierRisk.riskMultiplierMed = 2.0;
    REQUIRE(InitiativeRanker(heavierRisk).score(base) < baseScore);

    RankingConfiguration heavierTime;
    heavierTime.timeMultiplierPerWeek = 0.05;
    REQUIRE(InitiativeRanker(heavierTime).score(base) < baseScore);
}

TEST_CASE("InitiativeRanker configuration", "[InitiativeRanker]")
{
    SECTION("Invalid configuration fails before scoring")
    {
        RankingConfiguration zeroRisk;
        zeroRisk.riskMultiplierLow = 0.0;
        REQUIRE_THROWS_AS(InitiativeRanker(zeroRisk), RankingConfigurationException);

        RankingConfiguration negativeTime;
        negativeTime.timeMultiplierPerWeek = -0.01;
        REQUIRE_THROWS_AS(InitiativeRanker(negativeTime), RankingConfigurationException);

        RankingConfiguration notFinite;
        notFinite.riskMultiplierHigh = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(InitiativeRanker(notFinite), RankingConfigurationException);
    }

    SECTION("Zero denominator scores zero")
    {
        RankingConfiguration noTime;
        noTime.timeMultiplierBase = 0.0;
        noTime.timeMultiplierPerWeek = 0.0;
        InitiativeRanker ranker(noTime);

        auto sized = makeSized("A", 1000.0, 2000.0, 0.5, RiskLevel::Low, 8);
        REQUIRE(ranker.score(sized) == 0.0);
    }

    SECTION("Multiplier lookups")
    {
        RankingConfiguration config;
        REQUIRE(config.riskMultiplier(RiskLevel::Low) == 1.0);
        REQUIRE(config.riskMultiplier(RiskLevel::Med) == 1.2);
        REQUIRE(config.riskMultiplier(RiskLevel::High) == 1.5);
        REQUIRE(config.timeMultiplier(8) == Approx(1.08));
        REQUIRE(config.timeMultiplier(0) == 1.0);
    }
}
