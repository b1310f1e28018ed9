#ifndef ESGATE_CORE_LOGGING_H
#define ESGATE_CORE_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <esgate/core/exception.h>

namespace esgate {

// Get the logger that esgate writes to.
// If the application hasn't registered a logger named "esgate", one that
// writes to stdout is created on first use.
std::shared_ptr<spdlog::logger>
get_logger();

// Set the level of the esgate logger from a spdlog level name (e.g., "debug").
void
set_log_level(string const& level_name);
// If the name isn't recognized, this exception is thrown.
ESGATE_DEFINE_EXCEPTION(invalid_log_level)
ESGATE_DEFINE_ERROR_INFO(string, log_level_name)

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n  " << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define ESGATE_LOG_CALL(args)                                                 \
    {                                                                         \
        auto logger = esgate::get_logger();                                   \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define ESGATE_LOG_ARG(arg)                                                   \
    esgate::detail::arg_logger<                                               \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace esgate

#endif
