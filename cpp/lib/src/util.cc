/** \file    util.cc
 *  \brief   Implementation of the logger and of Usage().
 *  \author  Dr. Johannes Ruscheinski
 */

/*
    Copyright (C) 2015-2024 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "util.h"
#include <iostream>
#include <vector>
#include <cstdlib>
#include <ctime>
#include <unistd.h>
#include "Compiler.h"
#include "StringUtil.h"


char *progname; // Must be set in main() with "progname = argv[0];";


const std::string Logger::FUNCTION_NAME_SEPARATOR(" --> ");


// Called before "logger" exists, so we can't use Logger::StringToLogLevel() here.
static bool IsValidLogLevelName(const char * const level_candidate) {
    return std::strcmp(level_candidate, "ERROR") == 0 or std::strcmp(level_candidate, "WARNING") == 0
           or std::strcmp(level_candidate, "INFO") == 0 or std::strcmp(level_candidate, "DEBUG") == 0;
}


Logger::Logger()
    : log_fd_(STDERR_FILENO), log_process_pids_(false), log_no_decorations_(false), log_strip_call_site_(false),
      min_log_level_(LL_INFO)
{
    const char * const min_log_level(::getenv("MIN_LOG_LEVEL"));
    if (min_log_level != nullptr and IsValidLogLevelName(min_log_level))
        min_log_level_ = Logger::StringToLogLevel(min_log_level);
    const char * const logger_format(::getenv("LOGGER_FORMAT"));
    if (logger_format != nullptr) {
        if (std::strstr(logger_format, "process_pids") != nullptr)
            log_process_pids_ = true;
        if (std::strstr(logger_format, "no_decorations") != nullptr)
            log_no_decorations_ = true;
        if (std::strstr(logger_format, "strip_call_site") != nullptr)
            log_strip_call_site_ = true;
    }
}


void Logger::error(const std::string &msg) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);

    std::string error_message_string;
    if (errno != 0)
        error_message_string = " (last errno error code: " + std::string(std::strerror(errno)) + ")";

    writeString("SEVERE", msg + error_message_string);
    std::exit(EXIT_FAILURE);
}


void Logger::warning(const std::string &msg) {
    if (min_log_level_ < LL_WARNING)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString("WARN", msg);
}


void Logger::info(const std::string &msg) {
    if (min_log_level_ < LL_INFO)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString("INFO", msg);
}


void Logger::debug(const std::string &msg) {
    if (min_log_level_ < LL_DEBUG) {
        const char * const util_log_debug(::getenv("UTIL_LOG_DEBUG"));
        if (util_log_debug == nullptr or std::strcmp(util_log_debug, "true") != 0)
            return;
    }

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString("DEBUG", msg);
}


inline Logger *LoggerInstantiator() {
    return new Logger();
}


Logger *logger(LoggerInstantiator());


Logger::LogLevel Logger::StringToLogLevel(const std::string &level_candidate) {
    if (level_candidate == "ERROR")
        return Logger::LL_ERROR;
    if (level_candidate == "WARNING")
        return Logger::LL_WARNING;
    if (level_candidate == "INFO")
        return Logger::LL_INFO;
    if (level_candidate == "DEBUG")
        return Logger::LL_DEBUG;
    LOG_ERROR("not a valid minimum log level: \"" + level_candidate + "\"! (Use ERROR, WARNING, INFO or DEBUG)");
}


namespace {


// Local time in ISO 8601 format, e.g. "2024-03-01T17:45:03".
std::string GetCurrentDateAndTime() {
    const time_t now(std::time(nullptr));
    struct tm local_time;
    if (unlikely(::localtime_r(&now, &local_time) == nullptr))
        return "????-??-??T??:??:??";

    char buffer[sizeof("YYYY-MM-DDTHH:MM:SS")];
    std::strftime(buffer, sizeof buffer, "%Y-%m-%dT%H:%M:%S", &local_time);
    return buffer;
}


} // unnamed namespace


void Logger::formatMessage(const std::string &level, std::string * const msg) {
    if (not log_no_decorations_) {
        *msg = GetCurrentDateAndTime() + " " + level + " " + std::string(::program_invocation_name) + ": " + *msg;
        if (log_process_pids_)
            *msg += " (PID: " + std::to_string(::getpid()) + ")";
    }

    if (log_strip_call_site_) {
        const auto END_OF_CALL_SITE_PREFIX(msg->find(FUNCTION_NAME_SEPARATOR));
        if (END_OF_CALL_SITE_PREFIX != std::string::npos)
            *msg = msg->substr(END_OF_CALL_SITE_PREFIX + FUNCTION_NAME_SEPARATOR.length());
    }

    *msg += '\n';
}


void Logger::writeString(const std::string &level, std::string msg) {
    formatMessage(level, &msg);

    if (unlikely(::write(log_fd_, reinterpret_cast<const void *>(msg.data()), msg.size()) == -1)) {
        const std::string error_message("in Logger::writeString(util.cc): write to file descriptor " + std::to_string(log_fd_)
                                        + " failed! (errno = " + std::to_string(errno) + ")");
#pragma GCC diagnostic ignored "-Wunused-result"
        ::write(STDERR_FILENO, error_message.data(), error_message.size());
#pragma GCC diagnostic warning "-Wunused-result"
        _exit(EXIT_FAILURE);
    }
}


[[noreturn]] void Usage(const std::string &usage_message) {
    std::vector<std::string> lines;
    StringUtil::SplitThenTrimWhite(usage_message, '\n', &lines, /* suppress_empty_components = */ false);
    auto line(lines.begin());
    if (unlikely(line == lines.cend()))
        LOG_ERROR("missing usage message!");

    std::cerr << "Usage: " << ::program_invocation_name << " [--min-log-level=(ERROR|WARNING|INFO|DEBUG)] " << *line << '\n';
    const std::string padding(__builtin_strlen("Usage: ") + __builtin_strlen(::program_invocation_name) + 1, ' ');
    for (++line; line != lines.cend(); ++line)
        std::cerr << padding << *line << '\n';

    std::exit(EXIT_FAILURE);
}
