#ifndef ESGATE_IO_MOCK_HTTP_H
#define ESGATE_IO_MOCK_HTTP_H

#include <mutex>

#include <esgate/io/http_requests.h>

namespace esgate {

// A scripted exchange pairs an expected request with either the response to
// give it or, if :response is none, a transport failure carrying
// :failure_message.
struct mock_http_exchange
{
    http_request request;
    optional<http_response> response;
    string failure_message;
};

// Make an exchange in which the request never gets a response.
inline mock_http_exchange
make_failed_exchange(http_request request, string failure_message)
{
    return mock_http_exchange{
        std::move(request), none, std::move(failure_message)};
}

typedef std::vector<mock_http_exchange> mock_http_script;

// A mock_http_session may be shared by connections on several threads.
struct mock_http_session
{
    mock_http_session()
    {
    }

    mock_http_session(mock_http_script script)
    {
        set_script(std::move(script));
    }

    // Set the script of expected exchanges for this mock HTTP session.
    void
    set_script(mock_http_script script);

    // Have all exchanges in the script been executed?
    bool
    is_complete() const;

    // Has the script been executed in order so far?
    bool
    is_in_order() const;

 private:
    friend struct mock_http_connection;

    mutable std::mutex mutex_;

    mock_http_script script_;

    // Has the script been executed in order so far?
    bool in_order_ = true;
};

struct mock_http_connection : http_connection_interface
{
    mock_http_connection(mock_http_session& session) : session_(session)
    {
    }

    http_response
    perform_request(http_request const& request) override;

 private:
    mock_http_session& session_;
};

} // namespace esgate

#endif
