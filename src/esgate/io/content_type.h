#ifndef ESGATE_IO_CONTENT_TYPE_H
#define ESGATE_IO_CONTENT_TYPE_H

#include <esgate/io/http_requests.h>

namespace esgate {

// the body encodings that we know how to decode
enum class content_type
{
    JSON,
    CBOR,
    OTHER
};

// Normalize a Content-Type header value.
// Media types are compared case-insensitively and parameters (e.g.,
// "; charset=UTF-8") are ignored.
content_type
parse_content_type(string const& header_value);

// Get the declared content type of a response.
// A response without a Content-Type header is treated as OTHER.
content_type
get_content_type(http_response const& response);

} // namespace esgate

#endif
