#include <esgate/config/client_config.h>

#include <fstream>

#include <boost/lexical_cast.hpp>

#include <esgate/utilities/environment.h>
#include <esgate/utilities/os.h>

namespace esgate {

bool
operator==(client_config const& a, client_config const& b)
{
    return a.cacert_path == b.cacert_path && a.read_timeout == b.read_timeout
           && a.max_idle_connections == b.max_idle_connections
           && a.log_level == b.log_level;
}

template<class T>
static void
read_optional_field(
    nlohmann::json const& json, char const* name, optional<T>& field)
{
    auto i = json.find(name);
    if (i == json.end() || i->is_null())
        return;
    try
    {
        field = i->get<T>();
    }
    catch (nlohmann::json::exception& e)
    {
        ESGATE_THROW(
            invalid_config() << config_problem_info(
                string("bad value for ") + name + ": " + e.what()));
    }
}

static void
check_positive(optional<integer> const& value, char const* name)
{
    if (value && *value <= 0)
    {
        ESGATE_THROW(
            invalid_config() << config_problem_info(
                string(name) + " must be positive"));
    }
}

void
from_json(nlohmann::json const& json, client_config& config)
{
    if (!json.is_object())
    {
        ESGATE_THROW(
            invalid_config()
            << config_problem_info("configuration must be a JSON object"));
    }
    read_optional_field(json, "cacert_path", config.cacert_path);
    read_optional_field(json, "read_timeout", config.read_timeout);
    read_optional_field(
        json, "max_idle_connections", config.max_idle_connections);
    read_optional_field(json, "log_level", config.log_level);
    check_positive(config.read_timeout, "read_timeout");
    check_positive(config.max_idle_connections, "max_idle_connections");
}

client_config
read_client_config(string const& path)
{
    std::ifstream in(path);
    if (!in)
    {
        ESGATE_THROW(
            invalid_config()
            << config_problem_info("unable to open config file " + path));
    }
    nlohmann::json json;
    try
    {
        in >> json;
    }
    catch (nlohmann::json::parse_error& e)
    {
        ESGATE_THROW(
            invalid_config() << config_problem_info(
                "config file " + path + " is not valid JSON: " + e.what()));
    }
    client_config config;
    from_json(json, config);
    return config;
}

static optional<integer>
read_integer_variable(string const& name)
{
    auto text = get_optional_environment_variable(name);
    if (!text)
        return none;
    try
    {
        return boost::lexical_cast<integer>(*text);
    }
    catch (boost::bad_lexical_cast&)
    {
        ESGATE_THROW(
            invalid_config() << config_problem_info(
                name + " must be an integer, not '" + *text + "'"));
    }
}

void
apply_environment_overrides(client_config& config)
{
    if (auto path = get_optional_environment_variable("ESGATE_CACERT_PATH"))
        config.cacert_path = path;
    if (auto timeout = read_integer_variable("ESGATE_READ_TIMEOUT"))
        config.read_timeout = timeout;
    if (auto idle = read_integer_variable("ESGATE_MAX_IDLE_CONNECTIONS"))
        config.max_idle_connections = idle;
    if (auto level = get_optional_environment_variable("ESGATE_LOG_LEVEL"))
        config.log_level = level;
    check_positive(config.read_timeout, "ESGATE_READ_TIMEOUT");
    check_positive(
        config.max_idle_connections, "ESGATE_MAX_IDLE_CONNECTIONS");
}

client_config
load_client_config()
{
    client_config config;
    if (auto path = get_optional_environment_variable("ESGATE_CONFIG_FILE"))
        config = read_client_config(*path);
    apply_environment_overrides(config);
    return config;
}

integer
get_read_timeout(client_config const& config)
{
    return config.read_timeout ? *config.read_timeout : 3600;
}

integer
get_max_idle_connections(client_config const& config)
{
    if (config.max_idle_connections)
        return *config.max_idle_connections;
    return detect_cpu_count();
}

} // namespace esgate
