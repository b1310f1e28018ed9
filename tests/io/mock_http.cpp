#include <esgate/io/mock_http.h>

#include <esgate/utilities/testing.h>

using namespace esgate;

static http_request
make_color_request(string const& color)
{
    return make_get_request(
        "http://localhost:9200/colors/_doc/" + color,
        {{"Accept", "application/json"}});
}

static http_response
make_color_response(string const& color)
{
    return make_http_200_response(
        R"({"_id":")" + color + R"(","found":true})");
}

TEST_CASE("mock GET request", "[io][mock_http]")
{
    mock_http_session session;
    session.set_script(
        {{make_color_request("navy"), make_color_response("navy")},
         {make_color_request("red"), make_color_response("red")},
         {make_color_request("indigo"), make_color_response("indigo")},
         {make_color_request("violet"), make_color_response("violet")}});

    REQUIRE(!session.is_complete());
    REQUIRE(session.is_in_order());

    mock_http_connection conn(session);

    REQUIRE(
        conn.perform_request(make_color_request("navy"))
        == make_color_response("navy"));
    REQUIRE(!session.is_complete());
    REQUIRE(session.is_in_order());

    REQUIRE(
        conn.perform_request(make_color_request("red"))
        == make_color_response("red"));
    REQUIRE(!session.is_complete());
    REQUIRE(session.is_in_order());

    REQUIRE(
        conn.perform_request(make_color_request("violet"))
        == make_color_response("violet"));
    REQUIRE(!session.is_complete());
    REQUIRE(!session.is_in_order());

    REQUIRE(
        conn.perform_request(make_color_request("indigo"))
        == make_color_response("indigo"));
    REQUIRE(session.is_complete());
    REQUIRE(!session.is_in_order());
}

TEST_CASE("mock failed request", "[io][mock_http]")
{
    mock_http_session session(
        {make_failed_exchange(
            make_color_request("navy"), "connection refused")});
    mock_http_connection conn(session);

    try
    {
        conn.perform_request(make_color_request("navy"));
        FAIL("no exception thrown");
    }
    catch (http_request_failure& e)
    {
        REQUIRE(
            get_required_error_info<internal_error_message_info>(e)
            == "connection refused");
    }
    REQUIRE(session.is_complete());
}

TEST_CASE("unscripted mock request", "[io][mock_http]")
{
    mock_http_session session;
    mock_http_connection conn(session);
    REQUIRE_THROWS_AS(
        conn.perform_request(make_color_request("navy")),
        internal_check_failed);
}
