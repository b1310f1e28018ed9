#include <esgate/elasticsearch/executor.h>

#include <iterator>

#include <esgate/core/logging.h>
#include <esgate/io/content_type.h>

namespace esgate {

static string const no_response_data = "no response data";

static string
render_text_body(string text)
{
    return text.empty() ? no_response_data : text;
}

static string
render_json_error_body(string const& text)
{
    try
    {
        return nlohmann::json::parse(text).dump(2);
    }
    catch (nlohmann::json::exception&)
    {
        // The server claimed JSON but didn't deliver it, so show what it did
        // deliver.
        return render_text_body(text);
    }
}

static string
render_cbor_error_body(string const& data)
{
    try
    {
        // CBOR is decoded into a JSON value so that errors always read the
        // same way, whichever encoding the server chose.
        return nlohmann::json::from_cbor(data).dump(2);
    }
    catch (nlohmann::json::exception&)
    {
        return render_text_body(data);
    }
}

string
render_error_body(http_response const& response)
{
    auto body = to_string(response.body);
    switch (get_content_type(response))
    {
        case content_type::JSON:
            return render_json_error_body(body);
        case content_type::CBOR:
            return render_cbor_error_body(body);
        case content_type::OTHER:
        default:
            return render_text_body(std::move(body));
    }
}

http_response
perform_elasticsearch_request(
    http_connection_interface& connection, http_request const& request)
{
    http_response response;
    try
    {
        response = connection.perform_request(request);
    }
    catch (http_request_failure& e)
    {
        string const* cause = get_error_info<internal_error_message_info>(e);
        ESGATE_THROW(
            elasticsearch_transport_error()
            << error_message_info(cause ? *cause : string("request failed"))
            << attempted_http_request_info(redact_request(request)));
    }

    if (!is_successful(response))
    {
        auto message = render_error_body(response);
        get_logger()->warn(
            "{} {} returned HTTP {}",
            get_method_name(request.method),
            redact_request(request).url,
            response.status_code);
        ESGATE_THROW(
            elasticsearch_remote_error()
            << http_status_code_info(response.status_code)
            << error_message_info(std::move(message))
            << attempted_http_request_info(redact_request(request)));
    }

    return response;
}

namespace detail {

void
throw_decode_error(http_request const& request, string const& message)
{
    ESGATE_THROW(
        elasticsearch_decode_error()
        << error_message_info(
               "unable to decode response to " + redact_request(request).url
               + ": " + message)
        << attempted_http_request_info(redact_request(request)));
}

} // namespace detail

http_request
make_json_request(
    http_request_method method,
    string url,
    optional<nlohmann::json> const& body)
{
    http_header_list headers{{"Accept", "application/json"}};
    if (!body)
        return make_http_request(method, std::move(url), headers, http_body());
    headers["Content-Type"] = "application/json";
    return make_http_request(
        method, std::move(url), headers, make_string_blob(body->dump()));
}

nlohmann::json
decode_json_body(std::istream& body)
{
    try
    {
        return nlohmann::json::parse(body);
    }
    catch (nlohmann::json::parse_error& e)
    {
        ESGATE_THROW(
            elasticsearch_decode_error() << error_message_info(
                string("response body is not valid JSON: ") + e.what()));
    }
}

string
decode_text_body(std::istream& body)
{
    return string(
        std::istreambuf_iterator<char>(body), std::istreambuf_iterator<char>());
}

} // namespace esgate
