#ifndef ESGATE_ELASTICSEARCH_ERROR_H
#define ESGATE_ELASTICSEARCH_ERROR_H

#include <esgate/io/http_requests.h>

// This file defines how failures of Elasticsearch requests are reported.
//
// Every failure is an elasticsearch_error, so callers that don't care about
// the details can catch that. The more specific types say what went wrong:
//
// - elasticsearch_transport_error: The request never got a response (DNS,
//   connection refused, timeout). There's no status code.
//
// - elasticsearch_remote_error: Elasticsearch responded with a status code
//   outside the 2xx range. The status code and the rendered body are
//   attached.
//
// - elasticsearch_decode_error: Elasticsearch accepted the request but the
//   response body didn't have the expected shape.
//
// All of them carry error_message_info.

namespace esgate {

ESGATE_DEFINE_EXCEPTION(elasticsearch_error)
ESGATE_DEFINE_ERROR_INFO(string, error_message)
ESGATE_DEFINE_ERROR_INFO(int, http_status_code)

ESGATE_DEFINE_DERIVED_EXCEPTION(
    elasticsearch_transport_error, elasticsearch_error)
ESGATE_DEFINE_DERIVED_EXCEPTION(elasticsearch_remote_error, elasticsearch_error)
ESGATE_DEFINE_DERIVED_EXCEPTION(elasticsearch_decode_error, elasticsearch_error)

// Get the HTTP status code associated with an error, if any.
optional<int>
get_error_status(elasticsearch_error const& e);

// Was the error a 404 (not found) response?
bool
is_404(elasticsearch_error const& e);

// Get the message associated with an error.
string
get_error_message(elasticsearch_error const& e);

// Describe an error as "HTTP <status> <message>" (or just the message if
// there's no status code).
string
describe_error(elasticsearch_error const& e);

} // namespace esgate

#endif
