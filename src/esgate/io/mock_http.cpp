#include <esgate/io/mock_http.h>

#include <algorithm>

namespace esgate {

void
mock_http_session::set_script(mock_http_script script)
{
    std::lock_guard<std::mutex> lock(mutex_);
    script_ = std::move(script);
    in_order_ = true;
}

bool
mock_http_session::is_complete() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return script_.empty();
}

bool
mock_http_session::is_in_order() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_order_;
}

http_response
mock_http_connection::perform_request(http_request const& request)
{
    std::unique_lock<std::mutex> lock(session_.mutex_);
    auto exchange
        = std::find_if(session_.script_.begin(), session_.script_.end(),
                       [&](auto const& exchange) {
                           return exchange.request == request;
                       });
    if (exchange == session_.script_.end())
    {
        ESGATE_THROW(
            internal_check_failed()
            << internal_error_message_info("unrecognized mock HTTP request")
            << attempted_http_request_info(request));
    }
    if (exchange != session_.script_.begin())
        session_.in_order_ = false;
    auto response = std::move(exchange->response);
    auto failure_message = std::move(exchange->failure_message);
    session_.script_.erase(exchange);
    lock.unlock();

    if (!response)
    {
        ESGATE_THROW(
            http_request_failure()
            << attempted_http_request_info(redact_request(request))
            << internal_error_message_info(failure_message));
    }
    return *response;
}

} // namespace esgate
