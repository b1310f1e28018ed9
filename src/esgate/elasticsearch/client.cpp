#include <esgate/elasticsearch/client.h>

#include <boost/algorithm/string/predicate.hpp>

#include <esgate/io/transport.h>

namespace esgate {

static index_options
normalize_options(index_options options)
{
    if (!boost::algorithm::ends_with(options.url, "/"))
        options.url += "/";
    return options;
}

elasticsearch::elasticsearch(index_options options)
    : options_(normalize_options(std::move(options)))
{
}

elasticsearch::elasticsearch(
    index_options options, http_connection_interface& connection)
    : options_(normalize_options(std::move(options))),
      connection_(&connection)
{
}

string
elasticsearch::url() const
{
    return options_.url;
}

string
elasticsearch::base_url() const
{
    return options_.url + options_.index_name;
}

string
elasticsearch::alias_url() const
{
    return options_.url + options_.alias;
}

http_connection_interface&
elasticsearch::connection() const
{
    return connection_ ? *connection_ : http_connection_for_thread();
}

} // namespace esgate
