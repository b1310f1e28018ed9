#include <esgate/io/http_requests.h>

#include <array>
#include <cstring>
#include <fstream>
#include <mutex>
#include <ostream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <curl/curl.h>

#include <esgate/core/logging.h>

namespace esgate {

char const*
get_method_name(http_request_method method)
{
    switch (method)
    {
        case http_request_method::POST:
            return "POST";
        case http_request_method::GET:
        default:
            return "GET";
        case http_request_method::PUT:
            return "PUT";
        case http_request_method::DELETE:
            return "DELETE";
        case http_request_method::PATCH:
            return "PATCH";
        case http_request_method::HEAD:
            return "HEAD";
    }
}

bool
operator==(http_request const& a, http_request const& b)
{
    return a.method == b.method && a.url == b.url && a.headers == b.headers
           && a.body == b.body;
}

bool
operator!=(http_request const& a, http_request const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, http_request const& request)
{
    s << get_method_name(request.method) << " " << request.url;
    for (auto const& header : request.headers)
        s << "\n    " << header.first << ": " << header.second;
    if (request.body.size != 0)
        s << "\n    (" << request.body.size << " byte body)";
    return s;
}

http_request
redact_request(http_request request)
{
    auto authorization_header = request.headers.find("Authorization");
    if (authorization_header != request.headers.end())
        authorization_header->second = "[redacted]";

    // Elasticsearch URLs frequently carry basic auth credentials.
    auto scheme_end = request.url.find("://");
    if (scheme_end != string::npos)
    {
        auto authority_start = scheme_end + 3;
        auto authority_end = request.url.find('/', authority_start);
        auto at = request.url.rfind('@', authority_end);
        if (at != string::npos && at > authority_start)
        {
            request.url.replace(
                authority_start, at - authority_start, "[redacted]");
        }
    }
    return request;
}

bool
operator==(http_response const& a, http_response const& b)
{
    return a.status_code == b.status_code && a.headers == b.headers
           && a.body == b.body;
}

http_response
make_http_response(int status_code, http_header_list headers, blob body)
{
    http_response response;
    response.status_code = status_code;
    response.headers = std::move(headers);
    response.body = std::move(body);
    return response;
}

http_response
make_http_200_response(string body)
{
    return make_http_response(
        200, http_header_list(), make_string_blob(std::move(body)));
}

optional<string>
find_header(http_response const& response, string const& name)
{
    for (auto const& header : response.headers)
    {
        if (boost::algorithm::iequals(header.first, name))
            return header.second;
    }
    return none;
}

// CERTIFICATES

// Count the certificates in the PEM bundle at :path by their BEGIN markers.
// The certificates themselves aren't parsed; libcurl rejects bad ones when
// a request is made.
static int
count_pem_certificates(string const& path)
{
    std::ifstream in(path);
    if (!in)
        return 0;
    int count = 0;
    string line;
    while (std::getline(in, line))
    {
        if (boost::algorithm::starts_with(line, "-----BEGIN CERTIFICATE-----"))
            ++count;
    }
    return count;
}

// Find the platform's native certificate bundle.
static optional<string>
find_native_cacert_bundle()
{
    static char const* const candidates[]
        = {"/etc/ssl/certs/ca-certificates.crt",
           "/etc/pki/tls/certs/ca-bundle.crt",
           "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem",
           "/etc/ssl/ca-bundle.pem",
           "/etc/ssl/cert.pem"};
    for (char const* candidate : candidates)
    {
        if (count_pem_certificates(candidate) > 0)
            return string(candidate);
    }
    return none;
}

// SYSTEM

struct http_request_system_impl
{
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;
    optional<string> cacert_path;
    long read_timeout = 0;
    long max_idle_connections = 0;
};

static void
lock_shared_data(CURL*, curl_lock_data data, curl_lock_access, void* userptr)
{
    auto& system = *reinterpret_cast<http_request_system_impl*>(userptr);
    system.locks[data].lock();
}

static void
unlock_shared_data(CURL*, curl_lock_data data, void* userptr)
{
    auto& system = *reinterpret_cast<http_request_system_impl*>(userptr);
    system.locks[data].unlock();
}

http_request_system::http_request_system(client_config const& config)
    : impl_(new http_request_system_impl)
{
    impl_->read_timeout = boost::numeric_cast<long>(get_read_timeout(config));
    impl_->max_idle_connections
        = boost::numeric_cast<long>(get_max_idle_connections(config));

#ifndef ESGATE_TEST_BUILD
    // There's no insecure fallback, so if we can't find any certificates to
    // trust, there's no point in going on.
    impl_->cacert_path
        = config.cacert_path ? config.cacert_path : find_native_cacert_bundle();
    if (!impl_->cacert_path || count_pem_certificates(*impl_->cacert_path) == 0)
    {
        ESGATE_THROW(
            http_request_system_error() << internal_error_message_info(
                "no valid certificates could be loaded; "
                "all HTTPS requests would fail"));
    }
#endif

    if (curl_global_init(CURL_GLOBAL_ALL))
    {
        ESGATE_THROW(
            http_request_system_error() << internal_error_message_info(
                "curl_global_init failed"));
    }

    CURLSH* share = curl_share_init();
    if (!share)
    {
        curl_global_cleanup();
        ESGATE_THROW(
            http_request_system_error() << internal_error_message_info(
                "curl_share_init failed"));
    }
    curl_share_setopt(share, CURLSHOPT_LOCKFUNC, lock_shared_data);
    curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, unlock_shared_data);
    curl_share_setopt(share, CURLSHOPT_USERDATA, impl_.get());
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    impl_->share = share;

    get_logger()->info(
        "HTTP request system initialized (read timeout {}s, {} idle "
        "connections)",
        impl_->read_timeout,
        impl_->max_idle_connections);
}

http_request_system::~http_request_system()
{
    curl_share_cleanup(impl_->share);
    curl_global_cleanup();
}

// CONNECTION

struct http_connection_impl
{
    CURL* curl = nullptr;
    http_request_system_impl* system = nullptr;
};

static void
reset_curl_connection(http_connection_impl& connection)
{
    CURL* curl = connection.curl;
    curl_easy_reset(curl);

    // Connections are used from many threads, so signals can't be used for
    // timeouts.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_SHARE, connection.system->share);
    curl_easy_setopt(
        curl, CURLOPT_MAXCONNECTS, connection.system->max_idle_connections);

    // Abandon the request if no data arrives for the whole read timeout.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(
        curl, CURLOPT_LOW_SPEED_TIME, connection.system->read_timeout);

    // Tell CURL to accept and decode gzipped responses.
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip");
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 1L);

#ifdef ESGATE_TEST_BUILD
    // Test clusters use self-signed certificates.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
#else
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(
        curl, CURLOPT_CAINFO, connection.system->cacert_path->c_str());
#endif
}

http_connection::http_connection(http_request_system& system)
    : impl_(new http_connection_impl)
{
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        ESGATE_THROW(
            http_request_system_error()
            << internal_error_message_info("curl_easy_init failed"));
    }
    impl_->curl = curl;
    impl_->system = &system.impl();
}

http_connection::~http_connection()
{
    if (impl_)
        curl_easy_cleanup(impl_->curl);
}

http_connection::http_connection(http_connection&&) = default;

http_connection&
http_connection::operator=(http_connection&& other)
{
    if (impl_)
        curl_easy_cleanup(impl_->curl);
    impl_ = std::move(other.impl_);
    return *this;
}

struct send_transmission_state
{
    char const* data = nullptr;
    size_t data_length = 0;
    size_t read_position = 0;
};

static size_t
transmit_request_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    send_transmission_state& state
        = *reinterpret_cast<send_transmission_state*>(userdata);
    size_t n_bytes
        = (std::min)(size * nmemb, state.data_length - state.read_position);
    if (n_bytes > 0)
    {
        std::memcpy(ptr, state.data + state.read_position, n_bytes);
        state.read_position += n_bytes;
    }
    return n_bytes;
}

static size_t
record_http_data(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& buffer = *reinterpret_cast<string*>(userdata);
    buffer.append(ptr, size * nmemb);
    return size * nmemb;
}

static void
set_up_send_transmission(
    CURL* curl,
    send_transmission_state& send_state,
    http_request const& request)
{
    send_state.data = request.body.data;
    send_state.data_length = request.body.size;
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, transmit_request_body);
    curl_easy_setopt(curl, CURLOPT_READDATA, &send_state);
}

static void
set_up_post_transmission(
    CURL* curl,
    send_transmission_state& send_state,
    http_request const& request)
{
    set_up_send_transmission(curl, send_state, request);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(
        curl, CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t(request.body.size));
}

struct scoped_curl_slist
{
    ~scoped_curl_slist()
    {
        curl_slist_free_all(list);
    }
    curl_slist* list = nullptr;
};

// Parse the raw header text that CURL recorded.
// If there were several responses (e.g., a 100 Continue before the real
// one), only the headers of the last one are kept.
static http_header_list
parse_response_headers(string const& header_text)
{
    http_header_list headers;
    std::istringstream stream(header_text);
    string line;
    while (std::getline(stream, line))
    {
        boost::algorithm::trim(line);
        if (boost::algorithm::starts_with(line, "HTTP/"))
        {
            headers.clear();
            continue;
        }
        auto index = line.find(':');
        if (index != string::npos)
        {
            headers[boost::algorithm::trim_copy(line.substr(0, index))]
                = boost::algorithm::trim_copy(line.substr(index + 1));
        }
    }
    return headers;
}

http_response
http_connection::perform_request(http_request const& request)
{
    auto redacted = redact_request(request);
    ESGATE_LOG_CALL(<< ESGATE_LOG_ARG(redacted))

    CURL* curl = impl_->curl;
    reset_curl_connection(*impl_);

    // Set the headers for the request.
    scoped_curl_slist curl_headers;
    for (auto const& header : request.headers)
    {
        auto header_string = header.first + ":" + header.second;
        curl_headers.list
            = curl_slist_append(curl_headers.list, header_string.c_str());
    }
    if (request.body.size != 0)
    {
        // Don't wait for a 100 Continue before sending bodies.
        curl_headers.list = curl_slist_append(curl_headers.list, "Expect:");
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers.list);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    // Set up for receiving the response body and headers.
    string body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, record_http_data);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    string header_text;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, record_http_data);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_text);

    // Let CURL know what the method is and set up for sending the body if
    // necessary.
    send_transmission_state send_state;
    switch (request.method)
    {
        case http_request_method::PUT:
            set_up_send_transmission(curl, send_state, request);
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(
                curl, CURLOPT_INFILESIZE_LARGE, curl_off_t(request.body.size));
            break;

        case http_request_method::POST:
            set_up_post_transmission(curl, send_state, request);
            break;

        case http_request_method::PATCH:
            set_up_post_transmission(curl, send_state, request);
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PATCH");
            break;

        case http_request_method::DELETE:
            if (request.body.size != 0)
                set_up_post_transmission(curl, send_state, request);
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;

        case http_request_method::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;

        case http_request_method::GET:
            // Elasticsearch accepts bodies on GET requests.
            if (request.body.size != 0)
            {
                set_up_post_transmission(curl, send_state, request);
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "GET");
            }
            break;
    }

    // Perform the request.
    CURLcode result = curl_easy_perform(curl);

    // Check for low-level CURL errors.
    if (result != CURLE_OK)
    {
        string message = curl_easy_strerror(result);
        get_logger()->warn(
            "{} {} failed: {}",
            get_method_name(request.method),
            redacted.url,
            message);
        ESGATE_THROW(
            http_request_failure()
            << attempted_http_request_info(std::move(redacted))
            << internal_error_message_info(message));
    }

    // Construct the response.
    http_response response;
    response.headers = parse_response_headers(header_text);
    response.body = make_string_blob(std::move(body));
    long status_code;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = boost::numeric_cast<int>(status_code);

    return response;
}

} // namespace esgate
