#ifndef ESGATE_ELASTICSEARCH_BULK_H
#define ESGATE_ELASTICSEARCH_BULK_H

#include <memory>

#include <nlohmann/json.hpp>

#include <esgate/elasticsearch/client.h>
#include <esgate/elasticsearch/error.h>

// This file provides concurrent bulk indexing.

namespace esgate {

// Compute how many workers a bulk session should use.
// There's no point in using more workers than the index has shards (shards
// are the unit of write parallelism) or than there are CPUs to encode the
// requests, and the configured cap is never exceeded. The result is always
// at least 1.
int
compute_bulk_concurrency(integer shards, integer cpus, integer cap);

// This exception indicates that a _bulk request was accepted but some of
// its commands failed. The message describes the first failure.
ESGATE_DEFINE_DERIVED_EXCEPTION(elasticsearch_bulk_error, elasticsearch_error)

struct bulk_session_state;

// A bulk_session submits index and delete commands to the index through a
// fixed number of worker threads. Commands are queued (the queue holds at
// most :queue_capacity of them) and each worker sends _bulk requests of
// roughly :batch_size bytes.
//
// Commands are submitted in no particular order across workers.
// If a request fails, the session stops and the error is rethrown by the
// next call to insert(), remove() or finish().
struct bulk_session
{
    bulk_session(
        elasticsearch es,
        std::size_t queue_capacity,
        int concurrency,
        std::size_t batch_size);
    ~bulk_session();

    bulk_session(bulk_session&&);
    bulk_session&
    operator=(bulk_session&&) = delete;

    // the number of workers
    int
    concurrency() const;

    // Queue a command to index :document under :id.
    // This blocks while the queue is full.
    void
    insert(string const& id, nlohmann::json const& document);

    // Queue a command to delete the document with :id.
    void
    remove(string const& id);

    // Wait for all queued commands to be submitted and stop the workers.
    // This returns the number of commands that were submitted.
    std::size_t
    finish();

 private:
    std::unique_ptr<bulk_session_state> state_;
};

// Start a bulk session for the index, with its concurrency computed from the
// index's shard count, the CPUs on this machine and the configured cap.
bulk_session
start_bulk(elasticsearch const& es);

} // namespace esgate

#endif
