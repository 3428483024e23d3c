#pragma once

#include "dataset.io.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(DsioLogLevel level);
    static DsioLogLevel get_log_level();

    template<typename... Args>
    static std::string log(DsioLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::scoped_lock lock(log_mutex_);

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case DsioLogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case DsioLogLevel_Info:
                prefix = "[INFO] ";
                break;
            case DsioLogLevel_Warning:
                prefix = "[WARNING] ";
                break;
            default:
                prefix = "[ERROR] ";
                stream = &std::cerr;
                break;
        }

        fs::path filepath(file);
        std::string filename = filepath.filename().string();

        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix << filename << ":" << line
           << " " << func << ": ";

        format_arg_(ss, std::forward<Args>(args)...);

        std::string message = ss.str();

        // the message is still returned so callers can throw it
        if (level >= current_level_ && current_level_ != DsioLogLevel_None) {
            *stream << message << std::endl;
        }

        return message;
    }

  private:
    static DsioLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream& ss) {}; // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static std::string get_timestamp_();
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(DsioLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(DsioLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(DsioLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(DsioLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
