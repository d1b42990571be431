#include <catch2/catch.hpp>
#include <chartsync/Util/TickMath.hpp>
#include <limits>

TEST_CASE("Tick delta to seconds", "[tick_math]")
{
	SECTION("One beat at 120 BPM")
	{
		REQUIRE(chartsync::TickDeltaToSec(192, 192.0, 120.0) == Approx(0.5));
		REQUIRE(chartsync::TickDeltaToSec(480, 480.0, 120.0) == Approx(0.5));
	}

	SECTION("Zero delta")
	{
		REQUIRE(chartsync::TickDeltaToSec(0, 192.0, 87.5) == Approx(0.0));
	}

	SECTION("Slow tempo")
	{
		// 2 beats at 60 BPM
		REQUIRE(chartsync::TickDeltaToSec(384, 192.0, 60.0) == Approx(2.0));
	}

	SECTION("Negative delta")
	{
		REQUIRE(chartsync::TickDeltaToSec(-96, 192.0, 120.0) == Approx(-0.25));
	}
}

TEST_CASE("Seconds delta to tick", "[tick_math]")
{
	SECTION("Exact values")
	{
		REQUIRE(chartsync::SecDeltaToTick(0.5, 192.0, 120.0) == 192);
		REQUIRE(chartsync::SecDeltaToTick(2.0, 192.0, 60.0) == 384);
	}

	SECTION("Rounded to the nearest tick")
	{
		// 1 tick at 192 resolution and 120 BPM = 0.0026041666s
		REQUIRE(chartsync::SecDeltaToTick(0.0026, 192.0, 120.0) == 1);
		REQUIRE(chartsync::SecDeltaToTick(0.0014, 192.0, 120.0) == 1);
		REQUIRE(chartsync::SecDeltaToTick(0.0012, 192.0, 120.0) == 0);
	}

	SECTION("Non-finite deltas")
	{
		constexpr double kInf = std::numeric_limits<double>::infinity();

		REQUIRE(chartsync::SecDeltaToTick(kInf, 192.0, 120.0) > chartsync::RelTick{ chartsync::kMaxTick });
		REQUIRE(chartsync::SecDeltaToTick(-kInf, 192.0, 120.0) < 0);
		REQUIRE(chartsync::SecDeltaToTick(std::numeric_limits<double>::quiet_NaN(), 192.0, 120.0) == 0);
	}

	SECTION("Round trip drifts by one tick at most")
	{
		for (chartsync::RelTick tick = 0; tick < 5000; tick += 7)
		{
			const double sec = chartsync::TickDeltaToSec(tick, 192.0, 133.333);
			const chartsync::RelTick result = chartsync::SecDeltaToTick(sec, 192.0, 133.333);
			REQUIRE(std::abs(result - tick) <= 1);
		}
	}
}

TEST_CASE("Invalid tempo arguments", "[tick_math]")
{
	constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
	constexpr double kInf = std::numeric_limits<double>::infinity();

	REQUIRE_THROWS_AS((void)chartsync::TickDeltaToSec(1, 0.0, 120.0), std::invalid_argument);
	REQUIRE_THROWS_AS((void)chartsync::TickDeltaToSec(1, -192.0, 120.0), std::invalid_argument);
	REQUIRE_THROWS_AS((void)chartsync::TickDeltaToSec(1, kNaN, 120.0), std::invalid_argument);
	REQUIRE_THROWS_AS((void)chartsync::TickDeltaToSec(1, 192.0, 0.0), std::invalid_argument);
	REQUIRE_THROWS_AS((void)chartsync::TickDeltaToSec(1, 192.0, kInf), std::invalid_argument);
	REQUIRE_THROWS_AS((void)chartsync::SecDeltaToTick(1.0, kInf, 120.0), std::invalid_argument);
	REQUIRE_THROWS_AS((void)chartsync::SecDeltaToTick(1.0, 192.0, -120.0), std::invalid_argument);
}

TEST_CASE("Fixed-point BPM", "[tick_math]")
{
	REQUIRE(chartsync::BPMMilliToBPM(120000) == Approx(120.0));
	REQUIRE(chartsync::BPMMilliToBPM(133333) == Approx(133.333));
	REQUIRE(chartsync::BPMToBPMMilli(140.5) == 140500);
	REQUIRE(chartsync::BPMToBPMMilli(99.9996) == 100000);
}
