#include <esgate/io/content_type.h>

#include <esgate/utilities/testing.h>

using namespace esgate;

TEST_CASE("content type parsing", "[io]")
{
    REQUIRE(parse_content_type("application/json") == content_type::JSON);
    REQUIRE(
        parse_content_type("application/json; charset=UTF-8")
        == content_type::JSON);
    REQUIRE(parse_content_type("Application/JSON") == content_type::JSON);
    REQUIRE(parse_content_type("application/cbor") == content_type::CBOR);
    REQUIRE(parse_content_type("text/plain") == content_type::OTHER);
    REQUIRE(parse_content_type("") == content_type::OTHER);
}

TEST_CASE("response content type", "[io]")
{
    REQUIRE(
        get_content_type(make_http_response(
            200, {{"content-type", "application/cbor"}}, blob()))
        == content_type::CBOR);
    REQUIRE(
        get_content_type(make_http_200_response("{}")) == content_type::OTHER);
}
