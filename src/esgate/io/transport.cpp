#include <esgate/io/transport.h>

#include <esgate/core/logging.h>

namespace esgate {

static http_request_system
create_http_request_system()
{
    auto config = load_client_config();
    if (config.log_level)
        set_log_level(*config.log_level);
    return http_request_system(config);
}

http_request_system&
get_http_request_system()
{
    static http_request_system the_system(create_http_request_system());
    return the_system;
}

http_connection_interface&
http_connection_for_thread()
{
    thread_local http_connection the_connection(get_http_request_system());
    return the_connection;
}

} // namespace esgate
