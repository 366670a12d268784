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

#include "../pch.h"
#include <cctype>
#include <cstdlib>
#include <type_traits>
#include <atomic>
#include <boost/filesystem/path.hpp>

namespace blockstatus {

    enum LogLevel {
        LOG_TRACE,    // Support engineering: detailed tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString(LogLevel l);

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        stringstream ss;
        LogLevel logLevel;
        string _threadName;
    public:
        /**
         * set the log sink; nullptr restores stderr
         */
        static void setLogFile(FILE* f);

        void flush();

        inline const string& getThreadName() const { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        Logger& operator<<(const char *x)   { ss << x; return *this; }
        Logger& operator<<(const string& x) { ss << x; return *this; }
        Logger& operator<<(char x)          { ss << x; return *this; }
        Logger& operator<<(int x)           { ss << x; return *this; }
        Logger& operator<<(long x)          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) { ss << x; return *this; }
        Logger& operator<<(unsigned x)      { ss << x; return *this; }
        Logger& operator<<(double x)        { ss << x; return *this; }
        Logger& operator<<(const void *x)   { ss << x; return *this; }
        Logger& operator<<(long long x)     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { ss << x; return *this; }
        Logger& operator<<(bool x)          { ss << (x ? "true" : "false"); return *this; }

        // Support for boost::filesystem::path
        template<typename PathType>
        typename std::enable_if<
            std::is_same<PathType, boost::filesystem::path>::value,
            Logger&
        >::type operator<<(const PathType& p) {
            ss << p.string();
            return *this;
        }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() : _threadName("blockstatus") {
            _init();
        }
        void _init() {
            ss.str("");
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

        ~LoggerWrapper() {
            // Filtered messages carry a nullptr logger
            if (should_flush_ && logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushes
            }
            return *this;
        }
    };

    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().setLogLevel( l ), true);
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper warn()    { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

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
