#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>
#include "logging.hpp"

TEST_CASE("fields render as key and text", "[logging]") {
    CHECK(obs::str_field("sql", "SELECT 1").value == "SELECT 1");
    CHECK(obs::int_field("seq", -3).value == "-3");
    CHECK(obs::bool_field("applied", false).value == "false");
    CHECK(obs::int_field("seq", 1).key == "seq");
}

TEST_CASE("leaving a logging scope shuts the logger down", "[logging]") {
    {
        obs::LoggingScope scope;
        obs::init_logging("warn");
        REQUIRE(spdlog::get("relmap"));
        RELMAP_LOG_WARN("scope about to close", { obs::int_field("n", 1) });
    }
    CHECK_FALSE(spdlog::get("relmap"));

    // the rest of the run keeps logging
    obs::init_logging("warn");
    CHECK(spdlog::get("relmap"));
}
