#pragma once

#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

//#define PDF_OUTLINE_LOG_ENABLE_FILE_LINE_FUNCTION

#ifndef PDF_OUTLINE_LOG_ROTATION_SIZE
#define PDF_OUTLINE_LOG_ROTATION_SIZE 10*1024*1024
#endif

#ifndef PDF_OUTLINE_LOG_ROTATION_TIME_POINT
#define PDF_OUTLINE_LOG_ROTATION_TIME_POINT 0,0,0
#endif

BOOST_LOG_GLOBAL_LOGGER(logger, boost::log::sources::severity_channel_logger_mt<boost::log::trivial::severity_level>)

#ifdef PDF_OUTLINE_LOG_ENABLE_FILE_LINE_FUNCTION
#define LOG(logger, severity) BOOST_LOG_SEV(logger::get(), boost::log::trivial::severity) \
    << "(" << __FILE__ << ":" << __LINE__ << ":" << __FUNCTION__ << ") "
#define LOG_CHANNEL(logger, channel, severity) BOOST_LOG_CHANNEL_SEV(logger::get(), channel, boost::log::trivial::severity) \
    << "(" << __FILE__ << ":" << __LINE__ << ":" << __FUNCTION__ << ") "
#else
#define LOG(logger, severity) BOOST_LOG_SEV(logger::get(), boost::log::trivial::severity)
#define LOG_CHANNEL(logger, channel, severity) BOOST_LOG_CHANNEL_SEV(logger::get(), channel, boost::log::trivial::severity)
#endif

// ===== log macros =====
#define LOG_TRACE   LOG(logger, trace)
#define LOG_DEBUG   LOG(logger, debug)
#define LOG_INFO    LOG(logger, info)
#define LOG_WARNING LOG(logger, warning)
#define LOG_ERROR   LOG(logger, error)
#define LOG_FATAL   LOG(logger, fatal)

#define LOG_CHANNEL_TRACE(channel)   LOG_CHANNEL(logger, channel, trace)
#define LOG_CHANNEL_DEBUG(channel)   LOG_CHANNEL(logger, channel, debug)
#define LOG_CHANNEL_INFO(channel)    LOG_CHANNEL(logger, channel, info)
#define LOG_CHANNEL_WARNING(channel) LOG_CHANNEL(logger, channel, warning)
#define LOG_CHANNEL_ERROR(channel)   LOG_CHANNEL(logger, channel, error)
#define LOG_CHANNEL_FATAL(channel)   LOG_CHANNEL(logger, channel, fatal)

struct Log_Sink_Options {
    boost::log::trivial::severity_level threshold = boost::log::trivial::info;
    bool console = true;
    // empty: no file sink
    std::string file_pattern;
};

// Installs console and/or rotating file sinks on the Boost.Log core.
// Safe to call once at startup; tests never call it.
void setup_log_sinks(const Log_Sink_Options& options);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws configuration_error on anything else.
boost::log::trivial::severity_level parse_severity_level(const std::string& name);
