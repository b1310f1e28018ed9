#ifndef ESGATE_CONFIG_CLIENT_CONFIG_H
#define ESGATE_CONFIG_CLIENT_CONFIG_H

#include <nlohmann/json.hpp>

#include <esgate/core/exception.h>

namespace esgate {

struct client_config
{
    // the CA bundle to trust -
    // The default is the platform's native certificate bundle.
    optional<string> cacert_path;

    // how long (in seconds) a request may go without receiving any data
    // before it's abandoned - The default is one hour, since bulk and search
    // requests against large indices can be very slow.
    optional<integer> read_timeout;

    // how many idle connections to keep open for reuse -
    // The default is one for each processor core.
    optional<integer> max_idle_connections;

    // the spdlog level name for the esgate logger (defaults to "info")
    optional<string> log_level;
};

bool
operator==(client_config const& a, client_config const& b);

// This exception indicates that configuration values were malformed.
ESGATE_DEFINE_EXCEPTION(invalid_config)
ESGATE_DEFINE_ERROR_INFO(string, config_problem)

void
from_json(nlohmann::json const& json, client_config& config);

// Read a client_config from a JSON file.
client_config
read_client_config(string const& path);

// Apply the ESGATE_* environment variable overrides to :config.
void
apply_environment_overrides(client_config& config);

// Get the configuration for the process-wide transport.
// This reads the file named by ESGATE_CONFIG_FILE (if set) and then applies
// the environment overrides.
client_config
load_client_config();

// the effective values, with defaults applied
integer
get_read_timeout(client_config const& config);
integer
get_max_idle_connections(client_config const& config);

} // namespace esgate

#endif
