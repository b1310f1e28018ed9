#include <esgate/elasticsearch/bulk.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

#include <boost/numeric/conversion/cast.hpp>

#include <esgate/core/logging.h>
#include <esgate/elasticsearch/executor.h>
#include <esgate/utilities/os.h>

namespace esgate {

using nlohmann::json;

int
compute_bulk_concurrency(integer shards, integer cpus, integer cap)
{
    return boost::numeric_cast<int>(
        (std::max)(integer(1), (std::min)(shards, (std::min)(cpus, cap))));
}

struct bulk_session_state
{
    elasticsearch es;
    std::size_t queue_capacity;
    std::size_t batch_size;

    // protects everything below
    std::mutex mutex;
    // for signalling workers that there are commands to send (or that it's
    // time to stop)
    std::condition_variable work_available;
    // for signalling producers that there's room in the queue
    std::condition_variable space_available;
    // NDJSON-encoded commands waiting to be sent
    std::deque<string> queue;
    // Set when no more commands are coming. Workers send what they have and
    // exit once the queue is empty.
    bool finishing = false;
    // Set when workers should exit immediately.
    bool terminating = false;
    // the first error that a worker encountered
    std::exception_ptr error;
    // the number of commands that have been submitted
    std::size_t submitted = 0;

    std::vector<std::thread> workers;
};

static string
describe_first_bulk_failure(json const& response)
{
    auto items = response.find("items");
    if (items != response.end() && items->is_array())
    {
        for (auto const& item : *items)
        {
            for (auto const& result : item.items())
            {
                auto error = result.value().find("error");
                if (error != result.value().end())
                {
                    // _id may be missing or null (e.g., for rejected
                    // auto-generated IDs).
                    auto id = result.value().find("_id");
                    return result.key() + " of "
                           + (id != result.value().end() && id->is_string()
                                  ? id->get<string>()
                                  : string("?"))
                           + " failed: " + error->dump();
                }
            }
        }
    }
    return "bulk request reported errors";
}

static void
submit_bulk_request(elasticsearch const& es, string payload)
{
    auto request = make_http_request(
        http_request_method::POST,
        es.base_url() + "/_bulk",
        {{"Accept", "application/json"},
         {"Content-Type", "application/x-ndjson"}},
        make_string_blob(std::move(payload)));
    auto response = execute_request(es.connection(), request, decode_json_body);
    if (!response.is_object())
    {
        detail::throw_decode_error(request, "_bulk response is not an object");
    }
    if (response.value("errors", false))
    {
        auto message = describe_first_bulk_failure(response);
        get_logger()->warn(
            "bulk indexing into {} failed: {}", es.index_name(), message);
        ESGATE_THROW(
            elasticsearch_bulk_error() << error_message_info(message));
    }
}

static void
run_bulk_worker(bulk_session_state& state)
{
    string payload;
    std::size_t command_count = 0;

    auto flush = [&] {
        submit_bulk_request(state.es, std::move(payload));
        payload.clear();
        std::lock_guard<std::mutex> lock(state.mutex);
        state.submitted += command_count;
        command_count = 0;
    };

    try
    {
        while (true)
        {
            string command;
            {
                std::unique_lock<std::mutex> lock(state.mutex);
                state.work_available.wait(lock, [&] {
                    return !state.queue.empty() || state.finishing
                           || state.terminating;
                });
                if (state.terminating)
                    return;
                if (state.queue.empty())
                    break;
                command = std::move(state.queue.front());
                state.queue.pop_front();
            }
            state.space_available.notify_one();

            payload += command;
            ++command_count;
            if (payload.size() >= state.batch_size)
                flush();
        }
        if (command_count != 0)
            flush();
    }
    catch (...)
    {
        // Stop the whole session. The error is rethrown to the producer.
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (!state.error)
                state.error = std::current_exception();
            state.terminating = true;
        }
        state.work_available.notify_all();
        state.space_available.notify_all();
    }
}

bulk_session::bulk_session(
    elasticsearch es,
    std::size_t queue_capacity,
    int concurrency,
    std::size_t batch_size)
    : state_(new bulk_session_state{
        std::move(es), (std::max)(queue_capacity, std::size_t(1)), batch_size})
{
    concurrency = (std::max)(concurrency, 1);
    for (int i = 0; i != concurrency; ++i)
    {
        state_->workers.emplace_back(
            [state = state_.get()] { run_bulk_worker(*state); });
    }
}

bulk_session::bulk_session(bulk_session&&) = default;

bulk_session::~bulk_session()
{
    if (!state_)
        return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->terminating = true;
    }
    state_->work_available.notify_all();
    state_->space_available.notify_all();
    for (auto& worker : state_->workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

int
bulk_session::concurrency() const
{
    return boost::numeric_cast<int>(state_->workers.size());
}

static void
enqueue_command(bulk_session_state& state, string command)
{
    {
        std::unique_lock<std::mutex> lock(state.mutex);
        state.space_available.wait(lock, [&] {
            return state.queue.size() < state.queue_capacity
                   || state.terminating;
        });
        if (state.error)
            std::rethrow_exception(state.error);
        if (state.finishing || state.terminating)
        {
            ESGATE_THROW(
                internal_check_failed() << internal_error_message_info(
                    "command queued on a finished bulk session"));
        }
        state.queue.push_back(std::move(command));
    }
    state.work_available.notify_one();
}

static json
make_action_metadata(elasticsearch const& es, string const& id)
{
    json metadata{{"_id", id}};
    // Only clusters that still have mapping types want to hear about them.
    if (!es.type_name().empty() && es.type_name() != "_doc")
        metadata["_type"] = es.type_name();
    return metadata;
}

void
bulk_session::insert(string const& id, json const& document)
{
    enqueue_command(
        *state_,
        json{{"index", make_action_metadata(state_->es, id)}}.dump() + "\n"
            + document.dump() + "\n");
}

void
bulk_session::remove(string const& id)
{
    enqueue_command(
        *state_,
        json{{"delete", make_action_metadata(state_->es, id)}}.dump() + "\n");
}

std::size_t
bulk_session::finish()
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->finishing = true;
    }
    state_->work_available.notify_all();
    for (auto& worker : state_->workers)
    {
        if (worker.joinable())
            worker.join();
    }
    if (state_->error)
        std::rethrow_exception(state_->error);
    get_logger()->info(
        "bulk session on {} submitted {} commands",
        state_->es.index_name(),
        state_->submitted);
    return state_->submitted;
}

bulk_session
start_bulk(elasticsearch const& es)
{
    auto const& options = es.options();
    int concurrency = compute_bulk_concurrency(
        options.shards, detect_cpu_count(), options.bulk_concurrency);
    get_logger()->info(
        "starting bulk session on {} with {} workers",
        es.index_name(),
        concurrency);
    return bulk_session(
        es,
        10000,
        concurrency,
        boost::numeric_cast<std::size_t>(
            (std::max)(options.batch_size, integer(1))));
}

} // namespace esgate
