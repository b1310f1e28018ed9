#include <esgate/io/content_type.h>

#include <boost/algorithm/string.hpp>

namespace esgate {

content_type
parse_content_type(string const& header_value)
{
    auto media_type = boost::algorithm::trim_copy(
        header_value.substr(0, header_value.find(';')));
    if (boost::algorithm::iequals(media_type, "application/json"))
        return content_type::JSON;
    if (boost::algorithm::iequals(media_type, "application/cbor"))
        return content_type::CBOR;
    return content_type::OTHER;
}

content_type
get_content_type(http_response const& response)
{
    auto header = find_header(response, "Content-Type");
    return header ? parse_content_type(*header) : content_type::OTHER;
}

} // namespace esgate
