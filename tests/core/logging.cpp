#include <esgate/core/logging.h>

#include <esgate/utilities/testing.h>

using namespace esgate;

TEST_CASE("esgate logger", "[core]")
{
    auto logger = get_logger();
    REQUIRE(logger);
    REQUIRE(logger->name() == "esgate");
    REQUIRE(get_logger() == logger);
}

TEST_CASE("log levels", "[core]")
{
    auto original_level = get_logger()->level();

    set_log_level("debug");
    REQUIRE(get_logger()->level() == spdlog::level::debug);

    set_log_level("off");
    REQUIRE(get_logger()->level() == spdlog::level::off);

    try
    {
        set_log_level("loud");
        FAIL("no exception thrown");
    }
    catch (invalid_log_level& e)
    {
        REQUIRE(get_required_error_info<log_level_name_info>(e) == "loud");
    }

    get_logger()->set_level(original_level);
}
