#ifndef ESGATE_ELASTICSEARCH_PREPARED_QUERY_H
#define ESGATE_ELASTICSEARCH_PREPARED_QUERY_H

#include <nlohmann/json.hpp>

#include <esgate/core/exception.h>

namespace esgate {

// A prepared_query is the query-DSL tree of a search, along with the
// modifiers that control how its results are returned.
//
// It's consumed by exactly one request. Rewriting aggregations for nested
// fields may remove parts of the tree (see take_nested_filter).
struct prepared_query
{
    // The default query matches everything.
    prepared_query();

    explicit prepared_query(nlohmann::json query_dsl);

    nlohmann::json const&
    query_dsl() const
    {
        return query_dsl_;
    }

    optional<integer> limit;
    optional<integer> offset;
    optional<double> min_score;
    optional<integer> row_estimate;

    // Remove the first nested query on :path from the query-DSL tree and
    // return its inner query, which is the filter that selects the nested
    // documents that the query was interested in.
    //
    // Afterwards, the tree no longer contains the nested query. If the nested
    // query was the whole tree, the tree becomes a match_all query.
    // If there's no nested query on :path, this returns none and leaves the
    // tree alone.
    optional<nlohmann::json>
    take_nested_filter(string const& path);

 private:
    nlohmann::json query_dsl_;
};

bool
operator==(prepared_query const& a, prepared_query const& b);

// Make a query that searches for :text with Elasticsearch's query_string
// syntax.
prepared_query
make_query_string_query(string const& text);

// Serialization -
// A prepared_query is written as
// { "limit": ..., "offset": ..., "min_score": ..., "row_estimate": ...,
//   "query_dsl": ... }
// where the modifiers only appear if they're set.
void
to_json(nlohmann::json& j, prepared_query const& query);
void
from_json(nlohmann::json const& j, prepared_query& query);

} // namespace esgate

#endif
