#include <esgate/config/client_config.h>

#include <cstdio>
#include <fstream>

#include <esgate/utilities/environment.h>
#include <esgate/utilities/os.h>
#include <esgate/utilities/testing.h>

using namespace esgate;

TEST_CASE("config defaults", "[config]")
{
    client_config config;
    REQUIRE(get_read_timeout(config) == 3600);
    REQUIRE(get_max_idle_connections(config) == detect_cpu_count());

    config.read_timeout = 30;
    config.max_idle_connections = 4;
    REQUIRE(get_read_timeout(config) == 30);
    REQUIRE(get_max_idle_connections(config) == 4);
}

TEST_CASE("config from JSON", "[config]")
{
    client_config config;
    from_json(
        nlohmann::json::parse(R"(
            {
                "cacert_path": "/etc/esgate/ca.pem",
                "read_timeout": 120,
                "log_level": "debug"
            }
        )"),
        config);

    client_config expected;
    expected.cacert_path = "/etc/esgate/ca.pem";
    expected.read_timeout = 120;
    expected.log_level = "debug";
    REQUIRE(config == expected);
}

TEST_CASE("invalid config JSON", "[config]")
{
    client_config config;
    REQUIRE_THROWS_AS(
        from_json(nlohmann::json::array(), config), invalid_config);
    REQUIRE_THROWS_AS(
        from_json(nlohmann::json{{"read_timeout", "soon"}}, config),
        invalid_config);
    REQUIRE_THROWS_AS(
        from_json(nlohmann::json{{"max_idle_connections", 0}}, config),
        invalid_config);
}

TEST_CASE("config files", "[config]")
{
    string path = "esgate_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"max_idle_connections": 7})";
    }
    auto config = read_client_config(path);
    REQUIRE(config.max_idle_connections == some(integer(7)));
    std::remove(path.c_str());

    try
    {
        read_client_config("nonexistent_esgate_config.json");
        FAIL("no exception thrown");
    }
    catch (invalid_config& e)
    {
        REQUIRE(
            get_required_error_info<config_problem_info>(e).find(
                "nonexistent_esgate_config.json")
            != string::npos);
    }
}

TEST_CASE("config environment overrides", "[config]")
{
    set_environment_variable("ESGATE_READ_TIMEOUT", "45");
    set_environment_variable("ESGATE_LOG_LEVEL", "warn");

    client_config config;
    config.read_timeout = 10;
    config.max_idle_connections = 3;
    apply_environment_overrides(config);
    REQUIRE(config.read_timeout == some(integer(45)));
    REQUIRE(config.max_idle_connections == some(integer(3)));
    REQUIRE(config.log_level == some(string("warn")));

    set_environment_variable("ESGATE_READ_TIMEOUT", "forever");
    REQUIRE_THROWS_AS(apply_environment_overrides(config), invalid_config);

    set_environment_variable("ESGATE_READ_TIMEOUT", "-1");
    REQUIRE_THROWS_AS(apply_environment_overrides(config), invalid_config);

    set_environment_variable("ESGATE_READ_TIMEOUT", "");
    set_environment_variable("ESGATE_LOG_LEVEL", "");
}
