#ifndef ESGATE_UTILITIES_ERRORS_H
#define ESGATE_UTILITIES_ERRORS_H

#include <esgate/core/exception.h>

namespace esgate {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
ESGATE_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally.
ESGATE_DEFINE_EXCEPTION(internal_check_failed)

} // namespace esgate

#endif
