#include <catch2/catch.hpp>
#include "poly_scatter/io/summary.hpp"

#include <chrono>
#include <string>

using namespace poly_scatter;

TEST_CASE("Clock time format", "[summary]") {
    const std::string text = format_clock_time(std::chrono::system_clock::now());
    REQUIRE(text.size() == 8);
    REQUIRE(text[2] == ':');
    REQUIRE(text[5] == ':');
}

TEST_CASE("Summary line", "[summary]") {
    const WallTime start = std::chrono::system_clock::now();
    const WallTime end = start + std::chrono::milliseconds(12340);

    const std::string expected_times = format_clock_time(start) + " - " + format_clock_time(end);

    SECTION("With tag") {
        REQUIRE(format_summary("A123", start, end, 57) == "A123 " + expected_times + " - 12.3 - 57");
    }

    SECTION("Without tag") {
        REQUIRE(format_summary("", start, end, 0) == expected_times + " - 12.3 - 0");
    }

    SECTION("Elapsed rounds to one decimal") {
        const std::string line = format_summary("", start, start + std::chrono::milliseconds(5000), 3);
        REQUIRE(line.find(" - 5.0 - 3") != std::string::npos);
    }
}

TEST_CASE("Count line", "[summary]") {
    REQUIRE(format_count_line("A123", 57) == "A123, 57");
    REQUIRE(format_count_line("", 8) == "8");
}
