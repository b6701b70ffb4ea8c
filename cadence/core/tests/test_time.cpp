#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cadence/core/time.hpp>
#include <chrono>
#include <limits>
#include <thread>

using namespace cadence::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("Time starts at zero", "[core][time]") {
    Time time;

    REQUIRE(time.delta() == 0.0);
    REQUIRE(time.elapsed() == 0.0);
    REQUIRE(time.frame_count() == 0);
    REQUIRE(time.time_scale() == 1.0);
}

TEST_CASE("Time advance accumulates deltas", "[core][time]") {
    Time time;
    double sum = 0.0;

    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        time.advance();
        REQUIRE(time.delta() >= 0.0);
        sum += time.delta();
    }

    REQUIRE(time.frame_count() == 5);
    REQUIRE_THAT(time.elapsed(), WithinAbs(sum, 1e-12));
    REQUIRE(time.elapsed() >= 0.01);
}

TEST_CASE("Time first delta measures from construction", "[core][time]") {
    Time time;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    time.advance();

    REQUIRE(time.delta() >= 0.004);
    REQUIRE(time.elapsed() == time.delta());
}

TEST_CASE("Time scale", "[core][time]") {
    Time time;

    SECTION("Zero scale freezes the clock") {
        time.set_time_scale(0.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        time.advance();
        time.advance();

        REQUIRE(time.delta() == 0.0);
        REQUIRE(time.elapsed() == 0.0);
        REQUIRE(time.frame_count() == 2);
    }

    SECTION("Negative scale is clamped") {
        time.set_time_scale(-2.0);
        REQUIRE(time.time_scale() == 0.0);

        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        time.advance();
        REQUIRE(time.delta() >= 0.0);
    }

    SECTION("Non-finite scale freezes the clock") {
        time.set_time_scale(std::numeric_limits<double>::quiet_NaN());
        REQUIRE(time.time_scale() == 0.0);

        time.set_time_scale(std::numeric_limits<double>::infinity());
        REQUIRE(time.time_scale() == 0.0);

        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        time.advance();
        REQUIRE(time.delta() == 0.0);
        REQUIRE(time.elapsed() == 0.0);
    }

    SECTION("Double speed") {
        time.set_time_scale(2.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        time.advance();
        REQUIRE(time.delta() >= 0.009);
    }
}

TEST_CASE("Time reset", "[core][time]") {
    Time time;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    time.advance();
    time.advance();

    time.reset();

    REQUIRE(time.delta() == 0.0);
    REQUIRE(time.elapsed() == 0.0);
    REQUIRE(time.frame_count() == 0);
}
