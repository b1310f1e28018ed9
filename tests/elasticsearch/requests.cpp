#include <esgate/elasticsearch/requests.h>

#include <esgate/elasticsearch/executor.h>
#include <esgate/io/mock_http.h>
#include <esgate/utilities/testing.h>

using namespace esgate;

using nlohmann::json;

static index_options
make_blog_options()
{
    index_options options;
    options.url = "http://localhost:9200";
    options.index_name = "blog_v2";
    options.alias = "blog";
    return options;
}

TEST_CASE("index URLs", "[elasticsearch][requests]")
{
    mock_http_session session;
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    REQUIRE(es.url() == "http://localhost:9200/");
    REQUIRE(es.base_url() == "http://localhost:9200/blog_v2");
    REQUIRE(es.alias_url() == "http://localhost:9200/blog");
    REQUIRE(es.index_name() == "blog_v2");
    REQUIRE(es.alias_name() == "blog");
    REQUIRE(es.type_name() == "_doc");
    REQUIRE(&es.connection() == &connection);
}

TEST_CASE("index mappings", "[elasticsearch][requests]")
{
    json mapping_response = json::parse(R"(
        {
            "blog_v2": {
                "mappings": {
                    "properties": {
                        "comments": { "type": "nested" }
                    }
                }
            }
        }
    )");
    mock_http_session session(
        {{make_json_request(
              http_request_method::GET,
              "http://localhost:9200/blog_v2/_mapping",
              none),
          make_http_200_response(mapping_response.dump())}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    remote_schema schema(es);
    REQUIRE(schema.is_nested_path("comments"));
    // The mapping is only requested once.
    REQUIRE(!schema.is_nested_path("title"));
    REQUIRE(session.is_complete());
}

TEST_CASE("index mappings that can't be read", "[elasticsearch][requests]")
{
    auto mapping_request = make_json_request(
        http_request_method::GET,
        "http://localhost:9200/blog_v2/_mapping",
        none);
    mock_http_session session(
        {{mapping_request,
          make_http_response(
              404,
              {{"Content-Type", "application/json"}},
              make_string_blob(R"({"error":"index_not_found_exception"})"))},
         {mapping_request,
          make_http_200_response(R"(
              {
                  "blog_v2": {
                      "mappings": {
                          "properties": {
                              "comments": { "type": "nested" }
                          }
                      }
                  }
              }
          )")}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    remote_schema schema(es);
    // Nothing is nested without a mapping.
    REQUIRE(!schema.is_nested_path("comments"));
    REQUIRE(!session.is_complete());
    // The failure isn't remembered, so the next question asks again.
    REQUIRE(schema.is_nested_path("comments"));
    REQUIRE(session.is_complete());
}

TEST_CASE("index aliases", "[elasticsearch][requests]")
{
    auto make_alias_request = [](char const* action) {
        return make_json_request(
            http_request_method::POST,
            "http://localhost:9200/_aliases",
            json::parse(
                string(R"({"actions":[{")") + action
                + R"(":{"index":"blog_v2","alias":"blog_old"}}]})"));
    };
    mock_http_session session(
        {{make_alias_request("add"),
          make_http_200_response(R"({"acknowledged":true})")},
         {make_alias_request("remove"),
          make_http_200_response(R"({"acknowledged":true})")}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    add_index_alias(es, "blog_old");
    remove_index_alias(es, "blog_old");
    REQUIRE(session.is_complete());
    REQUIRE(session.is_in_order());
}

TEST_CASE("index refresh", "[elasticsearch][requests]")
{
    mock_http_session session(
        {{make_json_request(
              http_request_method::POST,
              "http://localhost:9200/blog_v2/_refresh",
              none),
          make_http_200_response(R"({"_shards":{"failed":0}})")}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    refresh_index(es);
    REQUIRE(session.is_complete());
}

TEST_CASE("document counts", "[elasticsearch][requests]")
{
    auto query = make_query_string_query("cats");
    mock_http_session session(
        {{make_json_request(
              http_request_method::POST,
              "http://localhost:9200/blog/_count",
              json{{"query", query.query_dsl()}}),
          make_http_200_response(R"({"count":42,"_shards":{}})")}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    REQUIRE(count_documents(es, query) == 42);
}

TEST_CASE("arbitrary requests", "[elasticsearch][requests]")
{
    mock_http_session session(
        {{make_json_request(
              http_request_method::GET,
              "http://localhost:9200/_cluster/health",
              none),
          make_http_200_response(R"({"status":"green"})")},
         {make_json_request(
              http_request_method::PUT,
              "http://localhost:9200/blog_v2/_settings",
              json{{"index", {{"refresh_interval", "-1"}}}}),
          make_http_200_response(R"({"acknowledged":true})")}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    REQUIRE(
        arbitrary_request(es, http_request_method::GET, "/_cluster/health")
        == R"({"status":"green"})");
    REQUIRE(
        arbitrary_request(
            es,
            http_request_method::PUT,
            "_settings",
            json{{"index", {{"refresh_interval", "-1"}}}})
        == R"({"acknowledged":true})");
    REQUIRE(session.is_complete());
}

TEST_CASE("arbitrary requests that may fail", "[elasticsearch][requests]")
{
    auto request = make_json_request(
        http_request_method::DELETE,
        "http://localhost:9200/blog_v2/_doc/7",
        none);
    mock_http_session session(
        {{request,
          make_http_response(
              404,
              {{"Content-Type", "application/json"}},
              make_string_blob(R"({"result":"not_found"})"))},
         {request, make_http_200_response(R"({"result":"deleted"})")}});
    mock_http_connection connection(session);
    elasticsearch es(make_blog_options(), connection);

    REQUIRE(
        arbitrary_request_or_none(es, http_request_method::DELETE, "_doc/7")
        == none);
    REQUIRE(
        arbitrary_request_or_none(es, http_request_method::DELETE, "_doc/7")
        == some(string(R"({"result":"deleted"})")));

    try
    {
        session.set_script(
            {{request,
              make_http_response(
                  404, {}, make_string_blob("no such document"))}});
        arbitrary_request(es, http_request_method::DELETE, "_doc/7");
        FAIL("no exception thrown");
    }
    catch (elasticsearch_error& e)
    {
        REQUIRE(is_404(e));
        REQUIRE(describe_error(e) == "HTTP 404 no such document");
    }
}
