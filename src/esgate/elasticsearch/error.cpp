#include <esgate/elasticsearch/error.h>

namespace esgate {

optional<int>
get_error_status(elasticsearch_error const& e)
{
    int const* status = get_error_info<http_status_code_info>(e);
    return status ? some(*status) : none;
}

bool
is_404(elasticsearch_error const& e)
{
    return get_error_status(e) == 404;
}

string
get_error_message(elasticsearch_error const& e)
{
    string const* message = get_error_info<error_message_info>(e);
    return message ? *message : string();
}

string
describe_error(elasticsearch_error const& e)
{
    auto status = get_error_status(e);
    return (status ? "HTTP " + std::to_string(*status) + " " : string())
           + get_error_message(e);
}

} // namespace esgate
