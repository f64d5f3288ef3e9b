#include "netbackup/logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace netbackup::logger {

severity_level parse_severity(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")   return boost::log::trivial::trace;
    if (lowered == "debug")   return boost::log::trivial::debug;
    if (lowered == "info")    return boost::log::trivial::info;
    if (lowered == "warning" || lowered == "warn") return boost::log::trivial::warning;
    if (lowered == "error")   return boost::log::trivial::error;
    if (lowered == "fatal")   return boost::log::trivial::fatal;

    throw LoggerError("Unknown log level: " + name);
}

void init_logging(severity_level min_level, const std::string& log_file) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        logging::add_console_log(
            std::clog,
            keywords::format = (
                expr::stream
                    << "[" << logging::trivial::severity << "] "
                    << expr::smessage
            ),
            keywords::auto_flush = true
        );

        if (!log_file.empty()) {
            // Convert to absolute path
            std::filesystem::path log_path = std::filesystem::absolute(log_file);
            logging::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::format = (
                    expr::stream
                        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                        << " [" << logging::trivial::severity << "]"
                        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
                        << " " << expr::smessage
                ),
                keywords::auto_flush = true
            );
        }

        logging::add_common_attributes();
        logging::core::get()->set_filter(logging::trivial::severity >= min_level);
        logging::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw LoggerError(std::string("Failed to initialize logging: ") + e.what());
    }
}

} // namespace netbackup::logger
