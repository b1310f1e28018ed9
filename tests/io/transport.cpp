#include <esgate/io/transport.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <thread>
#include <vector>

#include <esgate/utilities/environment.h>
#include <esgate/utilities/testing.h>

using namespace esgate;

namespace {

// Points ESGATE_CACERT_PATH at a scratch CA bundle for as long as it lives,
// so that the process-wide system can be created wherever this runs.
struct scoped_cacert_bundle
{
    scoped_cacert_bundle() : path("esgate_transport_test_ca.pem")
    {
        {
            std::ofstream out(path);
            out << "-----BEGIN CERTIFICATE-----\n"
                << "MIIB\n"
                << "-----END CERTIFICATE-----\n";
        }
        set_environment_variable("ESGATE_CACERT_PATH", path);
    }
    ~scoped_cacert_bundle()
    {
        set_environment_variable("ESGATE_CACERT_PATH", "");
        std::remove(path.c_str());
    }

    string path;
};

} // namespace

TEST_CASE("concurrent first use of the request system", "[io][transport]")
{
    scoped_cacert_bundle bundle;

    // Release all threads at once so that they race to create the system.
    int const thread_count = 8;
    std::atomic<bool> go(false);
    std::atomic<int> done(0);
    std::vector<http_request_system*> systems(thread_count, nullptr);
    std::vector<http_connection_interface*> connections(
        thread_count, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i != thread_count; ++i)
    {
        threads.emplace_back([&, i] {
            while (!go)
                std::this_thread::yield();
            systems[i] = &get_http_request_system();
            connections[i] = &http_connection_for_thread();
            // Keep every thread (and its connection) alive until all of them
            // have one.
            ++done;
            while (done != thread_count)
                std::this_thread::yield();
        });
    }
    go = true;
    for (auto& thread : threads)
        thread.join();

    for (int i = 0; i != thread_count; ++i)
    {
        REQUIRE(systems[i] == &get_http_request_system());
        REQUIRE(connections[i] != nullptr);
        for (int j = 0; j != i; ++j)
            REQUIRE(connections[i] != connections[j]);
    }
}

TEST_CASE("per-thread connections", "[io][transport]")
{
    scoped_cacert_bundle bundle;

    auto& system = get_http_request_system();
    REQUIRE(&get_http_request_system() == &system);

    auto* main_connection = &http_connection_for_thread();
    REQUIRE(&http_connection_for_thread() == main_connection);

    http_connection_interface* other_connection = nullptr;
    std::thread other(
        [&] { other_connection = &http_connection_for_thread(); });
    other.join();
    REQUIRE(other_connection != nullptr);
    REQUIRE(other_connection != main_connection);
}
