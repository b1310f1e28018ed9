#ifndef ESGATE_ELASTICSEARCH_EXECUTOR_H
#define ESGATE_ELASTICSEARCH_EXECUTOR_H

#include <istream>
#include <sstream>
#include <type_traits>

#include <nlohmann/json.hpp>

#include <esgate/elasticsearch/error.h>

// This file provides the primitive that every Elasticsearch request goes
// through: send the request, classify the outcome and decode the body.

namespace esgate {

// Render the body of an error response as text.
// JSON and CBOR bodies are rendered as pretty-printed JSON. Anything else is
// passed through verbatim. An empty body renders as "no response data".
string
render_error_body(http_response const& response);

// Perform :request and classify the outcome.
// - If no response is received, this throws elasticsearch_transport_error.
// - If the status is outside the 2xx range, this throws
//   elasticsearch_remote_error.
// Otherwise, the response is returned.
http_response
perform_elasticsearch_request(
    http_connection_interface& connection, http_request const& request);

namespace detail {

[[noreturn]] void
throw_decode_error(http_request const& request, string const& message);

} // namespace detail

// Perform :request and decode the body of the successful response with
// :decoder, which is called with a std::istream over the body.
// Decoders report malformed bodies by throwing elasticsearch_decode_error.
// JSON exceptions that escape a decoder are reported the same way.
template<class Decoder>
auto
execute_request(
    http_connection_interface& connection,
    http_request const& request,
    Decoder&& decoder)
{
    auto response = perform_elasticsearch_request(connection, request);
    std::istringstream body(to_string(response.body));
    try
    {
        return std::forward<Decoder>(decoder)(static_cast<std::istream&>(body));
    }
    catch (nlohmann::json::exception& e)
    {
        detail::throw_decode_error(request, e.what());
    }
}

// Make a request with an optional JSON body.
http_request
make_json_request(
    http_request_method method,
    string url,
    optional<nlohmann::json> const& body);

// Send a request with an optional JSON body and decode the response with
// :decoder (as above).
template<class Decoder>
auto
execute_json_request(
    http_connection_interface& connection,
    http_request_method method,
    string url,
    optional<nlohmann::json> const& body,
    Decoder&& decoder)
{
    return execute_request(
        connection,
        make_json_request(method, std::move(url), body),
        std::forward<Decoder>(decoder));
}

// STANDARD DECODERS

// Parse the body as JSON.
nlohmann::json
decode_json_body(std::istream& body);

// Read the body as text.
string
decode_text_body(std::istream& body);

// Ignore the body.
inline void
ignore_response_body(std::istream&)
{
}

} // namespace esgate

#endif
