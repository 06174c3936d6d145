#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace zgs {
namespace logging {

namespace {

boost::log::trivial::severity_level to_trivial(severity_level level) {
    switch (level) {
        case severity_level::trace:   return boost::log::trivial::trace;
        case severity_level::debug:   return boost::log::trivial::debug;
        case severity_level::info:    return boost::log::trivial::info;
        case severity_level::warning: return boost::log::trivial::warning;
        case severity_level::error:   return boost::log::trivial::error;
        case severity_level::fatal:   return boost::log::trivial::fatal;
    }
    return boost::log::trivial::info;
}

auto make_formatter() {
    namespace expr = boost::log::expressions;
    return expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << "] [" << boost::log::trivial::severity << "] "
        << expr::smessage;
}

} // namespace

const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
        default:                      return "UNKNOWN";
    }
}

std::ostream& operator<<(std::ostream& strm, severity_level level) {
    strm << to_string(level);
    return strm;
}

bool parse_severity(const std::string& name, severity_level& level) {
    if (name == "trace") level = severity_level::trace;
    else if (name == "debug") level = severity_level::debug;
    else if (name == "info") level = severity_level::info;
    else if (name == "warning") level = severity_level::warning;
    else if (name == "error") level = severity_level::error;
    else if (name == "fatal") level = severity_level::fatal;
    else return false;
    return true;
}

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        auto core = boost::log::core::get();
        core->remove_all_sinks();

        if (!log_file.empty()) {
            auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
            std::filesystem::path log_path = std::filesystem::absolute(log_file);
            backend->set_file_name_pattern(log_path.string());
            backend->set_rotation_size(10 * 1024 * 1024);
            backend->set_open_mode(std::ios::out | std::ios::app);
            backend->auto_flush(true);

            using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
            auto sink = boost::make_shared<file_sink>(backend);
            sink->set_formatter(make_formatter());
            core->add_sink(sink);
        } else {
            auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
            auto sink = boost::make_shared<console_sink>(backend);
            sink->set_formatter(make_formatter());
            core->add_sink(sink);
        }

        boost::log::add_common_attributes();
        set_log_level(min_level);
        core->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(debug) << "Logging: initialized"
                                 << (log_file.empty() ? " on console" : " with file: " + log_file);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= to_trivial(level));
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace logging
} // namespace zgs
