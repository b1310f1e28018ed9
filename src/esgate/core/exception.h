#ifndef ESGATE_CORE_EXCEPTION_H
#define ESGATE_CORE_EXCEPTION_H

#include <esgate/core/type_definitions.h>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace esgate {

// The following macros are simple wrappers around Boost.Exception to codify
// how that library should be used within esgate.

#define ESGATE_DEFINE_EXCEPTION(id)                                           \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

// Define an exception that can also be caught as the more general :base.
#define ESGATE_DEFINE_DERIVED_EXCEPTION(id, base)                             \
    struct id : base                                                          \
    {                                                                         \
    };

#define ESGATE_DEFINE_ERROR_INFO(T, id)                                       \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

ESGATE_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

#define ESGATE_THROW(x)                                                       \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << esgate::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// get_required_error_info is just like get_error_info except that it requires
// the info to be present and returns a const reference to it. If the info is
// missing, it throws its own exception.
ESGATE_DEFINE_EXCEPTION(missing_error_info)
ESGATE_DEFINE_ERROR_INFO(string, error_info_id)
ESGATE_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    typename ErrorInfo::error_info::value_type const* info
        = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        ESGATE_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

} // namespace esgate

#endif
