#ifndef ESGATE_IO_TRANSPORT_H
#define ESGATE_IO_TRANSPORT_H

#include <esgate/io/http_requests.h>

// This file provides the process-wide transport that all Elasticsearch
// requests go through.

namespace esgate {

// Get the process-wide HTTP request system.
// It's created on first use (from load_client_config()), exactly once, even
// if several threads get here at the same time. If creation fails, the
// exception propagates and the next call tries again.
http_request_system&
get_http_request_system();

// Get the HTTP connection for the calling thread.
// All such connections share the process-wide connection cache, so this is
// safe to call from any number of threads.
http_connection_interface&
http_connection_for_thread();

} // namespace esgate

#endif
