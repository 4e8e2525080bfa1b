// types_test.cpp - outcome parsing, resolution rules, JSON rendering and the in-memory ledger

#include <gtest/gtest.h>

#include "types.hpp"
#include "ledger.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "test_helpers.hpp"

#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using test_helpers::base_time;
using test_helpers::outcome;

// ===========================================================================
// 1. Resolution
// ===========================================================================

TEST(ResolutionTest, BandIsSymmetricAndInclusive) {
    EXPECT_EQ(classify_return(0.5, 0.5), Resolution::Breakeven);
    EXPECT_EQ(classify_return(-0.5, 0.5), Resolution::Breakeven);
    EXPECT_EQ(classify_return(0.0, 0.5), Resolution::Breakeven);
    EXPECT_EQ(classify_return(0.51, 0.5), Resolution::Win);
    EXPECT_EQ(classify_return(-0.51, 0.5), Resolution::Loss);
}

TEST(ResolutionTest, DirectionAliases) {
    EXPECT_EQ(direction_from_string("LONG"), Direction::Long);
    EXPECT_EQ(direction_from_string("buy"), Direction::Long);
    EXPECT_EQ(direction_from_string("call"), Direction::Long);
    EXPECT_EQ(direction_from_string("sell"), Direction::Short);
    EXPECT_EQ(direction_from_string("put"), Direction::Short);
    EXPECT_FALSE(direction_from_string("flat").has_value());
}

// ===========================================================================
// 2. Parsing
// ===========================================================================

TEST(TradeOutcomeParseTest, ParsesLedgerEvent) {
    json j = {
        {"id", "t-1"},
        {"symbol", "NVDA"},
        {"engine", "flow"},
        {"direction", "short"},
        {"signals", {"VWAP Cross", "Gap Fill"}},
        {"confidence", 72.5},
        {"catalyst", "earnings"},
        {"return_pct", -1.25},
        {"opened_at", "2024-01-01T00:00:00Z"},
        {"closed_at", "2024-01-02T00:00:00.250Z"}
    };

    auto parsed = TradeOutcome::from_json(j, 0.5);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->direction, Direction::Short);
    EXPECT_EQ(parsed->signals.size(), 2u);
    EXPECT_EQ(parsed->resolution, Resolution::Loss);
    EXPECT_FALSE(parsed->asset_type.has_value());
    EXPECT_EQ(parsed->opened_at, base_time());
    EXPECT_EQ(parsed->closed_at, base_time() + std::chrono::hours(24) + std::chrono::milliseconds(250));
}

TEST(TradeOutcomeParseTest, TimestampOffsetsConvertToUtc) {
    EXPECT_EQ(util::parse_iso8601("2024-01-01T02:00:00+02:00"), base_time());
    EXPECT_EQ(util::parse_iso8601("2023-12-31T19:00:00-0500"), base_time());
    EXPECT_EQ(util::parse_iso8601("2024-01-01 00:00:00+00"), base_time());
    EXPECT_EQ(util::parse_iso8601("2024-01-01T00:00:00"), base_time());
    EXPECT_THROW(util::parse_iso8601("2024-01-01T00:00:00+2"), std::runtime_error);
    EXPECT_THROW(util::parse_iso8601("2024-01-01T00:00:00 PST"), std::runtime_error);
}

TEST(TradeOutcomeParseTest, RejectsMissingFieldsAndUnknownDirection) {
    json missing = {{"id", "t-2"}, {"symbol", "NVDA"}};
    EXPECT_FALSE(TradeOutcome::from_json(missing, 0.5).has_value());

    json sideways = {
        {"id", "t-3"}, {"symbol", "NVDA"}, {"direction", "sideways"}, {"confidence", 50},
        {"return_pct", 1.0}, {"opened_at", "2024-01-01T00:00:00Z"}, {"closed_at", "2024-01-02T00:00:00Z"}
    };
    EXPECT_FALSE(TradeOutcome::from_json(sideways, 0.5).has_value());
}

TEST(CommandRequestTest, ParsesCommandWithArgs) {
    json j = {{"cmd", "set_override"}, {"corr_id", "abc"}, {"args", {{"signal", "Gap Fill"}, {"weight", 1.2}}}};

    auto req = CommandRequest::from_json(j);

    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->cmd, "set_override");
    EXPECT_EQ(req->args["signal"], "Gap Fill");
    EXPECT_FALSE(CommandRequest::from_json(json{{"cmd", "refresh"}}).has_value());
}

// ===========================================================================
// 3. JSON rendering
// ===========================================================================

TEST(JsonRenderTest, InfiniteRatiosRenderAsStrings) {
    EXPECT_EQ(ratio_to_json(std::numeric_limits<double>::infinity()), "+Infinity");
    EXPECT_EQ(ratio_to_json(-std::numeric_limits<double>::infinity()), "-Infinity");
    EXPECT_TRUE(ratio_to_json(std::nullopt).is_null());
    EXPECT_EQ(ratio_to_json(1.5), 1.5);
    EXPECT_TRUE(optional_to_json(std::numeric_limits<double>::infinity()).is_null());
}

TEST(JsonRenderTest, OverriddenWeightKeepsComputedValue) {
    SignalWeight w;
    w.signal_name = "Gap Fill";
    w.state = OverriddenWeight{1.7, 0.8};

    auto j = w.to_json();

    EXPECT_EQ(j["effective_weight"], 1.7);
    EXPECT_EQ(j["dynamic_weight"], 0.8);
    EXPECT_EQ(j["is_overridden"], true);
    EXPECT_EQ(j["confidence"], "untested");
}

// ===========================================================================
// 4. In-memory ledger
// ===========================================================================

TEST(InMemoryLedgerTest, AppendClosesOpenIdeaAndNotifies) {
    InMemoryLedger ledger(0.5);
    ledger.add_open_idea("NVDA", 2);
    int notified = 0;
    ledger.set_write_listener([&notified](const TradeOutcome&) { notified++; });

    ledger.append(outcome("a").symbol("NVDA").build());

    auto snap = ledger.load_snapshot();
    EXPECT_EQ(snap.outcomes.size(), 1u);
    EXPECT_EQ(snap.open_ideas.at("NVDA"), 1);
    EXPECT_EQ(snap.generation, 2u);
    EXPECT_EQ(notified, 1);
}

TEST(InMemoryLedgerTest, RejectsResolutionDisagreeingWithReturn) {
    InMemoryLedger ledger(0.5);
    auto row = outcome("x").ret(0.3).build();
    row.resolution = Resolution::Win;

    EXPECT_THROW(ledger.append(row), ValidationError);
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_EQ(ledger.load_snapshot().generation, 0u);
}
