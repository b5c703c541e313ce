#include <catch2/catch.hpp>
#include <cstdint>
#include <stdexcept>
#include "greenwave/CliOptions.hpp"

using namespace greenwave;

TEST_CASE("Options are read as --key value pairs after the command", "[cli]")
{
    const char *argv[] = {"greenwave", "optimize", "--scenario", "3", "--out", "runs/a.json"};
    Options options;
    REQUIRE(parseOptions(6, argv, options));
    REQUIRE(numericOption<int>(options, "scenario", 1) == 3);
    REQUIRE(stringOption(options, "out", "x") == "runs/a.json");
    REQUIRE(numericOption<std::size_t>(options, "pop", 20) == 20);

    const char *dangling[] = {"greenwave", "replay", "--seed"};
    Options rejected;
    REQUIRE_FALSE(parseOptions(3, dangling, rejected));
}

TEST_CASE("Unsigned options reject negative values", "[cli]")
{
    Options options{{"pop", "-3"}, {"gens", " -1"}, {"threads", "4"}, {"seed", "-7"}};
    REQUIRE_THROWS_AS(numericOption<std::size_t>(options, "pop", 20), std::invalid_argument);
    REQUIRE_THROWS_AS(numericOption<std::size_t>(options, "gens", 50), std::invalid_argument);
    REQUIRE_THROWS_AS(numericOption<uint32_t>(options, "seed", 42), std::invalid_argument);
    REQUIRE(numericOption<std::size_t>(options, "threads", 1) == 4);

    // Signed options still accept them.
    Options signed_options{{"offset", "-3"}};
    REQUIRE(numericOption<int>(signed_options, "offset", 0) == -3);
}

TEST_CASE("Non-numeric option values are rejected", "[cli]")
{
    Options options{{"sim-time", "60s"}, {"pop", "abc"}};
    REQUIRE_THROWS_AS(numericOption<double>(options, "sim-time", 60.0), std::invalid_argument);
    REQUIRE_THROWS_AS(numericOption<std::size_t>(options, "pop", 20), std::invalid_argument);
}
