#include "logger.hh"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

DsioLogLevel Logger::current_level_ = DsioLogLevel_Info;
std::mutex Logger::log_mutex_{};

void
Logger::set_log_level(DsioLogLevel level)
{
    if (level < DsioLogLevel_Debug || level > DsioLogLevel_None) {
        throw std::invalid_argument("Invalid log level");
    }

    std::scoped_lock lock(log_mutex_);
    current_level_ = level;
}

DsioLogLevel
Logger::get_log_level()
{
    return current_level_;
}

std::string
Logger::get_timestamp_()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
              1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count();

    return ss.str();
}
