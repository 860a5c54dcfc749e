/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <boost/thread/tss.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/filesystem/path.hpp>

namespace ckpbus {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // Support engineering: detailed tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Optional secondary sink that receives every flushed line.
     */
    class Tee {
    public:
        virtual ~Tee() {}
        virtual void write(LogLevel level, const std::string& str) = 0;
    };

    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        static Tee* tee;
        std::stringstream ss;
        int indent;
        LogLevel logLevel;
        std::string _threadName;
    public:

        friend class LogManager;

        /**
         * set the log file (nullptr = stderr)
         */
        static void setLogFile(FILE* f);

        /**
         * install a secondary sink (nullptr to remove)
         */
        static void setTee(Tee* t);

        void flush();

        inline std::string getThreadName() { return _threadName; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        template<typename T>
        typename std::enable_if<!std::is_same<T, boost::filesystem::path>::value, Logger&>::type
        operator<<(const T& x) { ss << x; return *this; }

        // boost::filesystem::path streams with quotes by default
        Logger& operator<<(const boost::filesystem::path& p) {
            ss << p.string();
            return *this;
        }

        Logger& operator<< (std::ostream& ( *_endl )(std::ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }

        Logger& prolog() {
            return *this;
        }

        void indentInc(){ indent++; }
        void indentDec(){ indent--; }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() {
            indent = 0;
            _threadName = "CKPBUS";
            _init();
        }
        void _init() {
            ss.str("");
            ss.clear();
            logLevel = LOG_INFO;
        }
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }
    };

    extern std::atomic<int> logLevel;

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        LoggerWrapper(LoggerWrapper&& other) noexcept
            : logger_(other.logger_), should_flush_(other.should_flush_) {
            other.logger_ = nullptr;
            other.should_flush_ = false;
        }

        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
            // Only do work if we have a logger (filtered messages have nullptr)
            if (should_flush_ && logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            // Short-circuit for filtered messages
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(std::ostream& (*endl)(std::ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushes
            }
            return *this;
        }
    };

    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )  // LogLevel enum: lower value = more verbose
            return LoggerWrapper(nullptr, false);   // Return no-op wrapper
        Logger& logger = Logger::get().prolog().setLogLevel( l );
        return LoggerWrapper(&logger, true);  // Auto-flush on destruction
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline std::string errnoWithDescription(int x = errno) {
        std::stringstream s;
        s << "errno:" << x << ' ' << std::strerror(x);
        return s.str();
    }

    struct LogIndentLevel {
        LogIndentLevel() {
            Logger::get().indentInc();
        }
        ~LogIndentLevel() {
            Logger::get().indentDec();
        }
    };

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")   { logLevel.store(LOG_TRACE, std::memory_order_relaxed); return true; }
        if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG, std::memory_order_relaxed); return true; }
        if (upper == "INFO")    { logLevel.store(LOG_INFO, std::memory_order_relaxed); return true; }
        if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
        if (upper == "ERROR")   { logLevel.store(LOG_ERROR, std::memory_order_relaxed); return true; }
        if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

        return false;
    }

    // Initialize logging from environment variable
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level) {
            if (!setLogLevelFromString(env_level)) {
                std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                         << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }
        }
    }

}
