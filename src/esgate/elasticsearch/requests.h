#ifndef ESGATE_ELASTICSEARCH_REQUESTS_H
#define ESGATE_ELASTICSEARCH_REQUESTS_H

#include <nlohmann/json.hpp>

#include <esgate/elasticsearch/client.h>
#include <esgate/elasticsearch/error.h>
#include <esgate/elasticsearch/prepared_query.h>
#include <esgate/elasticsearch/schema.h>

// This file provides the single-endpoint requests that are made against an
// index. All of them report failures as elasticsearch_error.

namespace esgate {

// Get the mapping of the index (GET <index>/_mapping).
nlohmann::json
get_index_mapping(elasticsearch const& es);

// Get the schema of the index from its mapping.
mapping_schema
get_index_schema(elasticsearch const& es);

// remote_schema is a schema_metadata_interface that reads the index's mapping
// the first time it's asked anything (and never again once that works).
// If the mapping can't be read, no path is nested.
struct remote_schema : schema_metadata_interface
{
    explicit remote_schema(elasticsearch es) : es_(std::move(es))
    {
    }

    bool
    is_nested_path(string const& path) const override;

 private:
    elasticsearch es_;
    mutable optional<mapping_schema> schema_;
};

// Add an alias for the index.
void
add_index_alias(elasticsearch const& es, string const& alias_name);

// Remove an alias from the index.
void
remove_index_alias(elasticsearch const& es, string const& alias_name);

// Refresh the index so that recent changes are visible to searches.
void
refresh_index(elasticsearch const& es);

// Count the documents (through the alias) that match :query.
integer
count_documents(elasticsearch const& es, prepared_query const& query);

// Make an arbitrary request and return the response body as text.
// An :endpoint starting with '/' is relative to the cluster URL. Otherwise,
// it's relative to the index URL.
string
arbitrary_request(
    elasticsearch const& es,
    http_request_method method,
    string const& endpoint,
    optional<nlohmann::json> const& body = none);

// Same as above, but any elasticsearch_error yields none.
optional<string>
arbitrary_request_or_none(
    elasticsearch const& es,
    http_request_method method,
    string const& endpoint,
    optional<nlohmann::json> const& body = none);

} // namespace esgate

#endif
