#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <unistd.h>

namespace {
    const int MAX_LOG_FILESIZE = 1024 * 1024;
    const unsigned int MAX_LOG_COUNT = 16;

    std::string log_path(const std::string &dir, unsigned long long index)
    {
        std::stringstream ss;
        ss << dir << "/log-" << index << ".txt";
        return ss.str();
    }
}

Logger::Logger():
m_dir(),
m_index(0),
m_file(),
m_level(LOG_INFO),
m_mutex()
{

}

Logger& Logger::instance()
{
    static Logger l;
    return l;
}

void Logger::err(const std::string &s)
{
    Logger::instance().log(LOG_ERR, "ERR", s);
}

void Logger::warn(const std::string &s)
{
    Logger::instance().log(LOG_WARN, "WARN", s);
}

void Logger::info(const std::string &s)
{
    Logger::instance().log(LOG_INFO, "INFO", s);
}

void Logger::debug(const std::string &s)
{
    Logger::instance().log(LOG_DEBUG, "DEBUG", s);
}

void Logger::startLogging(const std::string &dir)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    m_dir = dir;
    m_index = 0;
    m_file.open(log_path(m_dir, m_index), std::fstream::out | std::fstream::trunc);
}

void Logger::stopLogging()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_file.close();
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_level = level;
}

void Logger::log(LogLevel level, const char *prefix, const std::string &s)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    if (level < m_level)
        return;

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm local;
    localtime_r(&tt, &local);

    char buffer[256];
    strftime(buffer, sizeof(buffer) - 1, "%F %T", &local);
    buffer[255] = '\0';

    std::cout << '[' << buffer << "][" << prefix << "] " << s << std::endl;

    if (!m_file.is_open())
        return;

    m_file << '[' << buffer << "][" << prefix << "] " << s << '\n';
    m_file.flush();

    if (m_file.tellp() >= MAX_LOG_FILESIZE)
        rotate();
}

void Logger::rotate()
{
    m_file.close();
    m_index++;

    /* Do not keep too much logs */
    if (m_index >= MAX_LOG_COUNT)
        unlink(log_path(m_dir, m_index - MAX_LOG_COUNT).c_str());

    m_file.open(log_path(m_dir, m_index), std::fstream::out | std::fstream::trunc);
}

bool parse_log_level(const std::string &s, LogLevel &level)
{
    if (s == "debug")
        level = LOG_DEBUG;
    else if (s == "info")
        level = LOG_INFO;
    else if (s == "warn")
        level = LOG_WARN;
    else if (s == "err" || s == "error")
        level = LOG_ERR;
    else
        return false;

    return true;
}
