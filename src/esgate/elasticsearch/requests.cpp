#include <esgate/elasticsearch/requests.h>

#include <esgate/core/logging.h>
#include <esgate/elasticsearch/executor.h>

namespace esgate {

using nlohmann::json;

json
get_index_mapping(elasticsearch const& es)
{
    return execute_json_request(
        es.connection(),
        http_request_method::GET,
        es.base_url() + "/_mapping",
        none,
        decode_json_body);
}

mapping_schema
get_index_schema(elasticsearch const& es)
{
    return make_mapping_schema(get_index_mapping(es), es.index_name());
}

bool
remote_schema::is_nested_path(string const& path) const
{
    if (!schema_)
    {
        try
        {
            schema_ = get_index_schema(es_);
        }
        catch (elasticsearch_error& e)
        {
            // Without a mapping, nothing is known to be nested. The schema
            // isn't cached, so the next question tries again.
            get_logger()->warn(
                "no mapping for {}, treating {} as not nested: {}",
                es_.index_name(),
                path,
                describe_error(e));
            return false;
        }
    }
    return schema_->is_nested_path(path);
}

static void
update_alias(
    elasticsearch const& es, char const* action, string const& alias_name)
{
    json command{{"index", es.index_name()}, {"alias", alias_name}};
    json body{{"actions", json::array({json{{action, command}}})}};
    execute_json_request(
        es.connection(),
        http_request_method::POST,
        es.url() + "_aliases",
        body,
        ignore_response_body);
}

void
add_index_alias(elasticsearch const& es, string const& alias_name)
{
    update_alias(es, "add", alias_name);
}

void
remove_index_alias(elasticsearch const& es, string const& alias_name)
{
    update_alias(es, "remove", alias_name);
}

void
refresh_index(elasticsearch const& es)
{
    execute_json_request(
        es.connection(),
        http_request_method::POST,
        es.base_url() + "/_refresh",
        none,
        ignore_response_body);
}

integer
count_documents(elasticsearch const& es, prepared_query const& query)
{
    return execute_json_request(
        es.connection(),
        http_request_method::POST,
        es.alias_url() + "/_count",
        json{{"query", query.query_dsl()}},
        [](std::istream& body) {
            return decode_json_body(body).at("count").get<integer>();
        });
}

string
arbitrary_request(
    elasticsearch const& es,
    http_request_method method,
    string const& endpoint,
    optional<json> const& body)
{
    string url = !endpoint.empty() && endpoint[0] == '/'
                     ? es.url() + endpoint.substr(1)
                     : es.base_url() + "/" + endpoint;
    return execute_json_request(
        es.connection(), method, std::move(url), body, decode_text_body);
}

optional<string>
arbitrary_request_or_none(
    elasticsearch const& es,
    http_request_method method,
    string const& endpoint,
    optional<json> const& body)
{
    try
    {
        return arbitrary_request(es, method, endpoint, body);
    }
    catch (elasticsearch_error& e)
    {
        get_logger()->debug(
            "ignoring failed request to {}: {}", endpoint, describe_error(e));
        return none;
    }
}

} // namespace esgate
