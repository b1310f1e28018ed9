#ifndef ESGATE_ELASTICSEARCH_AGGREGATE_SEARCH_H
#define ESGATE_ELASTICSEARCH_AGGREGATE_SEARCH_H

#include <esgate/elasticsearch/aggregations.h>
#include <esgate/elasticsearch/client.h>

namespace esgate {

// This exception indicates that an aggregation request wasn't a JSON object
// of named aggregations.
ESGATE_DEFINE_EXCEPTION(invalid_aggregation_request)
ESGATE_DEFINE_ERROR_INFO(nlohmann::json, aggregation_request)

// An aggregate_search_request is a search that only asks for aggregations.
struct aggregate_search_request
{
    // :nesting_depth says how many levels of nested/filter wrapping the
    // aggregations in :aggs have (0, 1 or 2). It's used to dig the results
    // out of the response.
    aggregate_search_request(
        elasticsearch es,
        prepared_query query,
        aggregation_set aggs,
        int nesting_depth = 0);

    prepared_query const&
    query() const
    {
        return query_;
    }

    aggregation_set const&
    aggregations() const
    {
        return aggs_;
    }

    // the body of the search: {"size":0,"query":...,"aggs":...}
    nlohmann::json
    body() const;

    // Perform the search and return the results of the aggregations, keyed
    // by aggregation name. Results of nested aggregations are unwrapped, so
    // each name maps to the result of the aggregation that was asked for.
    nlohmann::json
    execute() const;

 private:
    elasticsearch es_;
    prepared_query query_;
    aggregation_set aggs_;
    int nesting_depth_;
};

// Aggregate on :field with a set of named aggregations.
// If :field lives inside nested documents, the aggregations are rewritten by
// rewrite_aggregations() (which may take the nested filter out of :query).
aggregate_search_request
aggregate_set(
    elasticsearch const& es,
    schema_metadata_interface const& schema,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    aggregation_set aggs);

// Same as above, with the schema read from the cluster when needed.
aggregate_search_request
aggregate_set(
    elasticsearch const& es,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    aggregation_set aggs);

// Aggregate with a single aggregation, which is named "the_agg".
aggregate_search_request
aggregate(
    elasticsearch const& es,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    nlohmann::json agg);

// Aggregate with a JSON object whose members are the named aggregations.
// Anything other than an object throws invalid_aggregation_request.
aggregate_search_request
arbitrary_aggregate(
    elasticsearch const& es,
    optional<string> const& field,
    bool need_filter,
    prepared_query query,
    nlohmann::json aggs);

} // namespace esgate

#endif
