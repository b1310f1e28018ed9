#ifndef ESGATE_ELASTICSEARCH_AGGREGATIONS_H
#define ESGATE_ELASTICSEARCH_AGGREGATIONS_H

#include <nlohmann/json.hpp>

#include <esgate/elasticsearch/prepared_query.h>
#include <esgate/elasticsearch/schema.h>

// This file provides the rewriting that lets aggregations target fields that
// live inside nested documents.

namespace esgate {

// An aggregation request maps aggregation names to aggregation bodies.
typedef std::map<string, nlohmann::json> aggregation_set;

// Get the path of the object that contains :field, which is everything
// before its last dot ("a.b.c" is contained in "a.b").
// A field without a dot has no containing path.
optional<string>
get_containing_path(string const& field);

// Wrap the aggregation :agg (named :name) so that it runs inside the nested
// documents at :path.
// Without a filter, this produces
//   {"nested":{"path":path},"aggs":{name:agg}}
// With one, the aggregation only sees the nested documents that match it:
//   {"nested":{"path":path},"aggs":{name:{"filter":filter,"aggs":{name:agg}}}}
nlohmann::json
make_nested_aggregation(
    string const& name,
    nlohmann::json agg,
    string const& path,
    optional<nlohmann::json> const& filter);

// Rewrite :aggs so that they work on :field.
//
// If :field is contained in an object that :schema says is nested, every
// aggregation in the set is wrapped (identically, each under its own name)
// by make_nested_aggregation(). When :need_filter is set, the filter is the
// nested query on that path taken out of :query (see take_nested_filter),
// so the rest of the query isn't filtered twice.
//
// Otherwise (including when there's no field), :aggs is returned unchanged.
//
// If :nesting_depth is supplied, it receives the number of wrapping levels
// that were added around each aggregation (0, 1 or 2).
aggregation_set
rewrite_aggregations(
    schema_metadata_interface const& schema,
    optional<string> const& field,
    bool need_filter,
    prepared_query& query,
    aggregation_set aggs,
    int* nesting_depth = nullptr);

} // namespace esgate

#endif
