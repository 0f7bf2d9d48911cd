// BoostLogger.h
#pragma once

#include <atomic>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <iostream>

namespace bl = boost::log;
namespace src = boost::log::sources;

class BoostLogger {
public:
    using severity_level = boost::log::trivial::severity_level;

    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        fatal = 5
    };

    struct Config {
        std::string name = "virtgate";
        std::string file_path = "logs/virtgate.log";
        Level console_level = Level::Info;
        Level file_level = Level::Trace;
        std::size_t rotation_size = 10 * 1024 * 1024; // 10 MB
        int max_files = 5;
        bool enable_console = true;
        bool enable_file = true;
    };

    // Sets up the sinks once; later calls are ignored.
    static void Init();
    static void Init(const Config& config);

    // "trace", "debug", "info", "warning", "error", "fatal"; anything else maps to Info.
    static Level LevelFromString(std::string_view name) noexcept;

    static void Trace(const auto& msg) { log_impl(severity_level::trace, msg); }
    static void Debug(const auto& msg) { log_impl(severity_level::debug, msg); }
    static void Info(const auto& msg) { log_impl(severity_level::info, msg); }
    static void Warn(const auto& msg) { log_impl(severity_level::warning, msg); }
    static void Error(const auto& msg) { log_impl(severity_level::error, msg); }
    static void Critical(const auto& msg) { log_impl(severity_level::fatal, msg); }

    // std::format flavours, e.g. BoostLogger::Info("Domain {} resolved", name)
    template <typename... Args>
    static void Debug(std::format_string<Args...> fmt, Args&&... args) {
        log_impl(severity_level::debug, std::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    static void Info(std::format_string<Args...> fmt, Args&&... args) {
        log_impl(severity_level::info, std::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    static void Warn(std::format_string<Args...> fmt, Args&&... args) {
        log_impl(severity_level::warning, std::format(fmt, std::forward<Args>(args)...));
    }
    template <typename... Args>
    static void Error(std::format_string<Args...> fmt, Args&&... args) {
        log_impl(severity_level::error, std::format(fmt, std::forward<Args>(args)...));
    }

private:
    inline static src::severity_logger_mt<severity_level> s_logger;
    inline static std::atomic<bool> s_initialized{false};
    inline static std::mutex s_init_mutex;

    static severity_level to_boost_level(Level level);
    static void log_impl(severity_level lvl, const auto& msg);
};

inline BoostLogger::severity_level BoostLogger::to_boost_level(Level level) {
    switch (level) {
        case Level::Trace:    return severity_level::trace;
        case Level::Debug:    return severity_level::debug;
        case Level::Info:     return severity_level::info;
        case Level::Warning:  return severity_level::warning;
        case Level::Error:    return severity_level::error;
        case Level::fatal:    return severity_level::fatal;
        default:              return severity_level::info;
    }
}

inline BoostLogger::Level BoostLogger::LevelFromString(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "fatal" || name == "critical") return Level::fatal;
    return Level::Info;
}

inline void BoostLogger::log_impl(severity_level lvl, const auto& msg) {
    if (!s_initialized.load(std::memory_order_acquire)) {
        // default sinks when nobody called Init() first
        Init();
    }
    BOOST_LOG_SEV(s_logger, lvl) << msg;
}

inline void BoostLogger::Init() {
    Init(Config{});
}

inline void BoostLogger::Init(const Config& config) {
    std::scoped_lock lock(s_init_mutex);
    if (s_initialized.load(std::memory_order_relaxed)) return;

    bl::core::get()->remove_all_sinks();
    bl::add_common_attributes();
    // a sink that cannot write (missing log dir, full disk) drops the record;
    // logging is called from noexcept release paths and must never throw
    bl::core::get()->set_exception_handler(bl::make_exception_suppressor());

    if (config.enable_console) {
        auto console_sink = bl::add_console_log(
            std::clog,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%"
        );
        console_sink->set_filter(bl::trivial::severity >= to_boost_level(config.console_level));
    }

    if (config.enable_file) {
        auto file_sink = bl::add_file_log(
            bl::keywords::file_name = config.file_path,
            bl::keywords::rotation_size = config.rotation_size,
            bl::keywords::max_size = config.rotation_size * config.max_files,
            bl::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
            bl::keywords::auto_flush = true
        );
        file_sink->set_filter(bl::trivial::severity >= to_boost_level(config.file_level));
    }

    bl::core::get()->set_filter(bl::trivial::severity >= severity_level::trace);

    s_initialized.store(true, std::memory_order_release);
}
