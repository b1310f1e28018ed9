#ifndef ESGATE_ELASTICSEARCH_SCHEMA_H
#define ESGATE_ELASTICSEARCH_SCHEMA_H

#include <nlohmann/json.hpp>

#include <esgate/core/type_definitions.h>

namespace esgate {

// schema_metadata_interface answers questions about the mapping of an index.
struct schema_metadata_interface
{
    virtual ~schema_metadata_interface()
    {
    }

    // Is the object at the dotted :path mapped as a nested type?
    // Paths that don't exist in the mapping are simply not nested.
    virtual bool
    is_nested_path(string const& path) const = 0;
};

// mapping_schema answers those questions from the mapping Elasticsearch
// reports for an index.
struct mapping_schema : schema_metadata_interface
{
    // :mappings is the "mappings" object of an index, either with the
    // properties directly inside or with a type name level in between.
    explicit mapping_schema(nlohmann::json const& mappings);

    bool
    is_nested_path(string const& path) const override;

 private:
    nlohmann::json properties_;
};

// Make a mapping_schema from the response to GET <index>/_mapping.
// If the response doesn't mention :index_name (e.g., because the request went
// through an alias), the first index in it is used.
mapping_schema
make_mapping_schema(
    nlohmann::json const& get_mapping_response, string const& index_name);

} // namespace esgate

#endif
