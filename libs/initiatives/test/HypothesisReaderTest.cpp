#include <catch2/catch_test_macros.hpp>
#include "HypothesisReader.h"

using namespace ebitdascope::initiatives;

TEST_CASE("HypothesisReader", "[HypothesisReader]")
{
    SECTION("Array of hypotheses")
    {
        auto hypotheses = HypothesisReader::readString(R"([
            { "title": "Consolidate SaaS tools", "category": "Vendor", "description": "Overlapping tools" },
            { "title": "Automate AP", "category": "Process" },
            { "title": "Move to reserved cloud capacity", "category": "Cost" }
        ])");

        REQUIRE(hypotheses.size() == 3);
        REQUIRE(hypotheses[0].title == "Consolidate SaaS tools");
        REQUIRE(hypotheses[0].category == InitiativeCategory::Vendor);
        REQUIRE(hypotheses[0].description == "Overlapping tools");
        REQUIRE(hypotheses[1].category == InitiativeCategory::Process);
        REQUIRE(hypotheses[1].description.empty());
        REQUIRE(hypotheses[2].category == InitiativeCategory::Infrastructure);
    }

    SECTION("Wrapped in an object")
    {
        auto hypotheses = HypothesisReader::readString(R"({ "hypotheses": [ { "title": "Raise prices" } ] })");
        REQUIRE(hypotheses.size() == 1);
        REQUIRE(hypotheses[0].category == InitiativeCategory::Pricing);
    }

    SECTION("Entries without a title are skipped")
    {
        auto hypotheses = HypothesisReader::readString(R"([ { "category": "Vendor" }, 42, { "title": "Keep me" } ])");
        REQUIRE(hypotheses.size() == 1);
        REQUIRE(hypotheses[0].title == "Keep me");
    }

    SECTION("Failures collapse to an empty list")
    {
        REQUIRE(HypothesisReader::readString("").empty());
        REQUIRE(HypothesisReader::readString("{ broken").empty());
        REQUIRE(HypothesisReader::readString(R"({ "title": "not a list" })").empty());
        REQUIRE(HypothesisReader::readFile("no_such_hypotheses.json").empty());
        REQUIRE(HypothesisReader::readString("[]").empty());
    }
}
