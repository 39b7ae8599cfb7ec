#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

enum LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARN,
    LOG_ERR,
};

class Logger {
public:
    Logger(const Logger &l) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger &l) = delete;
    Logger& operator=(Logger&&) = delete;

    static Logger& instance();

    static void err(const std::string &s);
    static void warn(const std::string &s);
    static void info(const std::string &s);
    static void debug(const std::string &s);

    /**
     * @brief Mirror log lines to rotating files log-N.txt in dir
     */
    void startLogging(const std::string &dir);
    void stopLogging();

    /**
     * @brief Discard messages below level
     */
    void setLevel(LogLevel level);

private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char *prefix, const std::string &s);
    void rotate();

    std::string m_dir;
    unsigned long long m_index;
    std::ofstream m_file;
    LogLevel m_level;
    std::mutex m_mutex;
};

/* Parse "debug", "info", "warn" or "err" */
bool parse_log_level(const std::string &s, LogLevel &level);

#endif
