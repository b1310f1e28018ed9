#include <esgate/elasticsearch/schema.h>

#include <esgate/utilities/testing.h>

using namespace esgate;

using nlohmann::json;

static json const blog_mappings = json::parse(R"(
    {
        "properties": {
            "title": { "type": "text" },
            "comments": {
                "type": "nested",
                "properties": {
                    "author": { "type": "keyword" },
                    "replies": {
                        "type": "nested",
                        "properties": { "text": { "type": "text" } }
                    }
                }
            },
            "meta": {
                "properties": { "tags": { "type": "keyword" } }
            }
        }
    }
)");

TEST_CASE("nested paths", "[elasticsearch][schema]")
{
    mapping_schema schema(blog_mappings);
    REQUIRE(schema.is_nested_path("comments"));
    REQUIRE(schema.is_nested_path("comments.replies"));
    REQUIRE(!schema.is_nested_path("meta"));
    REQUIRE(!schema.is_nested_path("title"));
    REQUIRE(!schema.is_nested_path("comments.author"));
    // Paths that aren't in the mapping aren't nested.
    REQUIRE(!schema.is_nested_path("nonexistent"));
    REQUIRE(!schema.is_nested_path("comments.nonexistent"));
    REQUIRE(!schema.is_nested_path(""));
}

TEST_CASE("typed mappings", "[elasticsearch][schema]")
{
    mapping_schema schema(json{{"_doc", blog_mappings}});
    REQUIRE(schema.is_nested_path("comments"));
    REQUIRE(!schema.is_nested_path("meta"));
}

TEST_CASE("schemas from _mapping responses", "[elasticsearch][schema]")
{
    json response{{"blog_v2", {{"mappings", blog_mappings}}}};

    REQUIRE(
        make_mapping_schema(response, "blog_v2").is_nested_path("comments"));
    // Responses to requests through an alias are keyed by the real index.
    REQUIRE(make_mapping_schema(response, "blog").is_nested_path("comments"));
    REQUIRE(!make_mapping_schema(json::object(), "blog").is_nested_path(
        "comments"));
}
