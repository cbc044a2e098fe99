/**
 * @file RateAggregatorTest.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include "RateAggregator.h"

TEST_CASE("window closes once and reports per-second rates", "[rates]") {
    RateAggregator rates;
    RateSample out;
    for (int i = 0; i < 6; ++i) rates.record(CrossingEvent::Kind::Enter);
    for (int i = 0; i < 3; ++i) rates.record(CrossingEvent::Kind::Exit);

    CHECK_FALSE(rates.advance(0.5, out));
    CHECK(rates.elapsed() == Approx(0.5));
    REQUIRE(rates.advance(0.5, out));
    CHECK(out.inRate == Approx(6.0));
    CHECK(out.outRate == Approx(3.0));

    // Counters and window time start over.
    CHECK(rates.enterCount() == 0);
    CHECK(rates.exitCount() == 0);
    CHECK(rates.elapsed() == 0.0);
}

TEST_CASE("rates are divided by the actual elapsed time", "[rates]") {
    RateAggregator rates;
    RateSample out;
    for (int i = 0; i < 5; ++i) rates.record(CrossingEvent::Kind::Exit);
    REQUIRE(rates.advance(1.25, out));
    CHECK(out.inRate == 0.0);
    CHECK(out.outRate == Approx(4.0));
}

TEST_CASE("zero and negative deltas do not advance the window", "[rates]") {
    RateAggregator rates;
    RateSample out;
    out.inRate = 42.0;
    rates.record(CrossingEvent::Kind::Enter);
    CHECK_FALSE(rates.advance(0.0, out));
    CHECK_FALSE(rates.advance(-5.0, out));
    CHECK(rates.elapsed() == 0.0);
    CHECK(rates.enterCount() == 1);
    CHECK(out.inRate == 42.0);
}

TEST_CASE("an empty window reports zero rates", "[rates]") {
    RateAggregator rates(0.5);
    RateSample out;
    out.inRate = out.outRate = -1.0;
    REQUIRE(rates.advance(0.6, out));
    CHECK(out.inRate == 0.0);
    CHECK(out.outRate == 0.0);
}

TEST_CASE("reset discards a partial window", "[rates]") {
    RateAggregator rates;
    RateSample out;
    rates.record(CrossingEvent::Kind::Enter);
    rates.advance(0.9, out);
    rates.reset();
    CHECK_FALSE(rates.advance(0.5, out));
    CHECK(rates.enterCount() == 0);
}

TEST_CASE("window length is floored above zero", "[rates]") {
    CHECK(RateAggregator().window() == Approx(RateAggregator::DefaultWindow));
    RateAggregator degenerate(0.0);
    CHECK(degenerate.window() > 0.0);
    RateSample out;
    degenerate.record(CrossingEvent::Kind::Enter);
    REQUIRE(degenerate.advance(0.5, out));
    CHECK(out.inRate == Approx(2.0));
}
