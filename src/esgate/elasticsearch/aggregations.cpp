#include <esgate/elasticsearch/aggregations.h>

#include <esgate/core/logging.h>

namespace esgate {

using nlohmann::json;

optional<string>
get_containing_path(string const& field)
{
    auto last_dot = field.rfind('.');
    if (last_dot == string::npos)
        return none;
    return field.substr(0, last_dot);
}

json
make_nested_aggregation(
    string const& name,
    json agg,
    string const& path,
    optional<json> const& filter)
{
    json inner;
    if (filter)
    {
        inner = json{
            {"filter", *filter}, {"aggs", json{{name, std::move(agg)}}}};
    }
    else
    {
        inner = std::move(agg);
    }
    return json{
        {"nested", json{{"path", path}}},
        {"aggs", json{{name, std::move(inner)}}}};
}

aggregation_set
rewrite_aggregations(
    schema_metadata_interface const& schema,
    optional<string> const& field,
    bool need_filter,
    prepared_query& query,
    aggregation_set aggs,
    int* nesting_depth)
{
    if (nesting_depth)
        *nesting_depth = 0;

    if (!field)
        return aggs;

    auto path = get_containing_path(*field);
    if (!path || !schema.is_nested_path(*path))
        return aggs;

    optional<json> filter;
    if (need_filter)
        filter = query.take_nested_filter(*path);

    get_logger()->debug(
        "aggregating on nested field {} (path {}, {})",
        *field,
        *path,
        filter ? "filtered" : "unfiltered");

    if (nesting_depth)
        *nesting_depth = filter ? 2 : 1;

    for (auto& agg : aggs)
    {
        agg.second = make_nested_aggregation(
            agg.first, std::move(agg.second), *path, filter);
    }
    return aggs;
}

} // namespace esgate
