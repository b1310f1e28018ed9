#include <esgate/elasticsearch/aggregate_search.h>

#include <esgate/elasticsearch/executor.h>
#include <esgate/elasticsearch/requests.h>

namespace esgate {

using nlohmann::json;

aggregate_search_request::aggregate_search_request(
    elasticsearch es,
    prepared_query query,
    aggregation_set aggs,
    int nesting_depth)
    : es_(std::move(es)),
      query_(std::move(query)),
      aggs_(std::move(aggs)),
      nesting_depth_(nesting_depth)
{
}

json
aggregate_search_request::body() const
{
    json aggs = json::object();
    for (auto const& agg : aggs_)
        aggs[agg.first] = agg.second;
    return json{{"size", 0}, {"query", query_.query_dsl()}, {"aggs", aggs}};
}

json
aggregate_search_request::execute() const
{
    auto aggregations = execute_json_request(
        es_.connection(),
        http_request_method::POST,
        es_.alias_url() + "/_search",
        body(),
        [](std::istream& body) {
            return decode_json_body(body).at("aggregations");
        });

    json results = json::object();
    for (auto const& agg : aggs_)
    {
        // Each level of wrapping repeats the aggregation's name.
        json const* result = &aggregations.at(agg.first);
        for (int i = 0; i != nesting_depth_; ++i)
            result = &result->at(agg.first);
        results[agg.first] = *result;
    }
    return results;
}

aggregate_search_request
aggregate_set(
    elasticsearch const& es,
    schema_metadata_interface const& schema,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    aggregation_set aggs)
{
    int nesting_depth = 0;
    auto rewritten = rewrite_aggregations(
        schema, field, need_filter, query, std::move(aggs), &nesting_depth);
    return aggregate_search_request(
        es, std::move(query), std::move(rewritten), nesting_depth);
}

aggregate_search_request
aggregate_set(
    elasticsearch const& es,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    aggregation_set aggs)
{
    remote_schema schema(es);
    return aggregate_set(
        es, schema, field, need_filter, std::move(query), std::move(aggs));
}

aggregate_search_request
aggregate(
    elasticsearch const& es,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    json agg)
{
    aggregation_set aggs;
    aggs["the_agg"] = std::move(agg);
    return aggregate_set(
        es, field, need_filter, std::move(query), std::move(aggs));
}

aggregate_search_request
arbitrary_aggregate(
    elasticsearch const& es,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    json aggs)
{
    if (!aggs.is_object())
    {
        ESGATE_THROW(
            invalid_aggregation_request() << aggregation_request_info(aggs));
    }
    aggregation_set agg_set;
    for (auto& agg : aggs.items())
        agg_set[agg.key()] = std::move(agg.value());
    return aggregate_set(
        es, field, need_filter, std::move(query), std::move(agg_set));
}

} // namespace esgate
