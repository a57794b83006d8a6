#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "logging.hpp"

int main(int argc, char* argv[]) {
    obs::LoggingScope logging;
    // RELMAP_LOG_LEVEL=debug shows the statements while a test runs
    obs::init_logging("warn");
    return Catch::Session().run(argc, argv);
}
