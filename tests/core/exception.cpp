#include <esgate/core/exception.h>

#include <esgate/utilities/testing.h>

#include <esgate/elasticsearch/error.h>

using namespace esgate;

TEST_CASE("error info", "[core]")
{
    elasticsearch_remote_error error;
    error << error_message_info("asdf");

    REQUIRE(get_required_error_info<error_message_info>(error) == "asdf");

    try
    {
        get_required_error_info<http_status_code_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        get_required_error_info<wrapped_exception_diagnostics_info>(e);
    }
}

TEST_CASE("derived exceptions", "[core]")
{
    try
    {
        ESGATE_THROW(
            elasticsearch_decode_error() << error_message_info("bad body"));
        FAIL("no exception thrown");
    }
    catch (elasticsearch_error& e)
    {
        REQUIRE(get_required_error_info<error_message_info>(e) == "bad body");
        // ESGATE_THROW attaches a stack trace.
        REQUIRE(get_error_info<stacktrace_info>(e) != nullptr);
        REQUIRE(string(e.what()).find("bad body") != string::npos);
    }
}
