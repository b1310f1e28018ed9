#include <esgate/core/logging.h>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace esgate {

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::mutex creation_mutex;
    std::lock_guard<std::mutex> lock(creation_mutex);
    auto logger = spdlog::get("esgate");
    if (!logger)
        logger = spdlog::stdout_color_mt("esgate");
    return logger;
}

void
set_log_level(string const& level_name)
{
    auto level = spdlog::level::from_str(level_name);
    // from_str() maps anything it doesn't recognize to "off", so make sure
    // that's what was actually asked for.
    if (level == spdlog::level::off && level_name != "off")
    {
        ESGATE_THROW(invalid_log_level() << log_level_name_info(level_name));
    }
    get_logger()->set_level(level);
}

} // namespace esgate
