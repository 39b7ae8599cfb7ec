#include "settings.hpp"
#include "batch_scheduler.hpp"
#include "bluetooth.hpp"
#include "connection_manager.hpp"
#include "device_cache.hpp"
#include "tcp_prober.hpp"
#include "topology.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

void invalid_value(const std::string &key, const std::string &val)
{
    std::stringstream ss;
    ss << "Invalid value \"" << val << "\" for " << key << " key. Keeping default.";
    Logger::err(ss.str());
}

void set_unsigned(const std::string &key, const std::string &val, unsigned int &setting)
{
    unsigned int value;
    if (parse_unsigned(val, value))
        setting = value;
    else
        invalid_value(key, val);
}

void set_bool(const std::string &key, const std::string &val, bool &setting)
{
    bool value;
    if (parse_bool(val, value))
        setting = value;
    else
        invalid_value(key, val);
}

std::string log_level_to_string(LogLevel level)
{
    switch (level) {
    case LOG_DEBUG: return "debug";
    case LOG_INFO: return "info";
    case LOG_WARN: return "warn";
    default: return "err";
    }
}

}

Settings::Settings():
batch_size(DEFAULT_BATCH_SIZE),
batch_delay_ms(DEFAULT_BATCH_DELAY),
cache_ttl_s(DEFAULT_CACHE_TTL),
connect_timeout_ms(DEFAULT_CONNECT_TIMEOUT),
attempt_timeout_ms(DEFAULT_ATTEMPT_TIMEOUT),
handshake_timeout_ms(DEFAULT_HANDSHAKE_TIMEOUT),
endpoint_timeout_ms(DEFAULT_ENDPOINT_TIMEOUT),
raw_timeout_ms(DEFAULT_RAW_TIMEOUT),
subnets(),
ports(),
capabilities(),
preview_port(DEFAULT_PREVIEW_PORT),
bluetooth_device(DEFAULT_RFCOMM_DEVICE),
credit_card_fee_percent(0.0),
log_level(LOG_INFO),
log_dir()
{

}

bool Settings::load(const std::string &path)
{
    std::ifstream file(path);
    if (!file) {
        std::stringstream ss;
        ss << "Could not load settings from file " << path;
        Logger::err(ss.str());
        return false;
    }

    parse(file);

    std::stringstream ss;
    ss << "Loaded settings from file " << path;
    Logger::debug(ss.str());
    return true;
}

void Settings::parse(std::istream &in)
{
    std::string line;

    while (std::getline(in, line)) {
        std::string key, val;

        if (!line.empty() && line[0] == '#')
            continue;
        if (!split_setting(line, key, val))
            continue;

        if (key == "batch_size") {
            unsigned int value;
            if (parse_unsigned(val, value) && value > 0)
                batch_size = value;
            else
                invalid_value(key, val);
        } else if (key == "batch_delay_ms") {
            set_unsigned(key, val, batch_delay_ms);
        } else if (key == "cache_ttl_s") {
            set_unsigned(key, val, cache_ttl_s);
        } else if (key == "connect_timeout_ms") {
            set_unsigned(key, val, connect_timeout_ms);
        } else if (key == "attempt_timeout_ms") {
            set_unsigned(key, val, attempt_timeout_ms);
        } else if (key == "handshake_timeout_ms") {
            set_unsigned(key, val, handshake_timeout_ms);
        } else if (key == "endpoint_timeout_ms") {
            set_unsigned(key, val, endpoint_timeout_ms);
        } else if (key == "raw_timeout_ms") {
            set_unsigned(key, val, raw_timeout_ms);
        } else if (key == "subnets") {
            std::vector<std::string> list;
            std::istringstream iss(val);
            std::string item;
            while (std::getline(iss, item, ',')) {
                item = trim(item);
                if (check_subnet_prefix(item)) {
                    list.push_back(item);
                } else {
                    std::stringstream msg;
                    msg << "Invalid subnet prefix: " << item;
                    Logger::warn(msg.str());
                }
            }
            subnets = dedup_subnets(list);
        } else if (key == "ports") {
            std::vector<uint16_t> list;
            std::istringstream iss(val);
            std::string item;
            while (std::getline(iss, item, ',')) {
                unsigned int port;
                if (parse_unsigned(trim(item), port) && port > 0 && port <= 65535) {
                    list.push_back(static_cast<uint16_t>(port));
                } else {
                    std::stringstream msg;
                    msg << "Invalid port: " << item;
                    Logger::warn(msg.str());
                }
            }
            ports = list;
        } else if (key == "supports_bluetooth") {
            set_bool(key, val, capabilities.supports_bluetooth);
        } else if (key == "probe_strategy") {
            if (!parse_probe_strategy(val, capabilities.probe_strategy))
                invalid_value(key, val);
        } else if (key == "preview_only") {
            set_bool(key, val, capabilities.preview_only);
        } else if (key == "preview_port") {
            unsigned int port;
            if (parse_unsigned(val, port) && port > 0 && port <= 65535)
                preview_port = static_cast<uint16_t>(port);
            else
                invalid_value(key, val);
        } else if (key == "bluetooth_device") {
            bluetooth_device = val;
        } else if (key == "credit_card_fee_percent") {
            double value;
            if (parse_double(val, value) && value >= 0.0 && value < 100.0)
                credit_card_fee_percent = value;
            else
                invalid_value(key, val);
        } else if (key == "log_level") {
            if (!parse_log_level(val, log_level))
                invalid_value(key, val);
        } else if (key == "log_dir") {
            log_dir = val;
        } else {
            std::stringstream ss;
            ss << "Invalid key \"" << key << '\"';
            Logger::warn(ss.str());
        }
    }
}

bool Settings::save(const std::string &path) const
{
    std::ofstream file(path);
    if (!file) {
        std::stringstream ss;
        ss << "Could not save settings to file " << path;
        Logger::err(ss.str());
        return false;
    }

    write(file);

    std::stringstream ss;
    ss << "Saved settings to file " << path;
    Logger::debug(ss.str());
    return true;
}

void Settings::write(std::ostream &out) const
{
    out << "batch_size=" << batch_size << '\n'
        << "batch_delay_ms=" << batch_delay_ms << '\n'
        << "cache_ttl_s=" << cache_ttl_s << '\n'
        << "connect_timeout_ms=" << connect_timeout_ms << '\n'
        << "attempt_timeout_ms=" << attempt_timeout_ms << '\n'
        << "handshake_timeout_ms=" << handshake_timeout_ms << '\n'
        << "endpoint_timeout_ms=" << endpoint_timeout_ms << '\n'
        << "raw_timeout_ms=" << raw_timeout_ms << '\n';

    if (!subnets.empty()) {
        out << "subnets=";
        for (size_t i = 0; i < subnets.size(); ++i) {
            if (i > 0)
                out << ',';
            out << subnets[i];
        }
        out << '\n';
    }

    if (!ports.empty()) {
        out << "ports=";
        for (size_t i = 0; i < ports.size(); ++i) {
            if (i > 0)
                out << ',';
            out << ports[i];
        }
        out << '\n';
    }

    out << "supports_bluetooth=" << (capabilities.supports_bluetooth ? "true" : "false") << '\n'
        << "probe_strategy=" << probe_strategy_to_string(capabilities.probe_strategy) << '\n'
        << "preview_only=" << (capabilities.preview_only ? "true" : "false") << '\n'
        << "preview_port=" << preview_port << '\n'
        << "bluetooth_device=" << bluetooth_device << '\n'
        << "credit_card_fee_percent=" << credit_card_fee_percent << '\n'
        << "log_level=" << log_level_to_string(log_level) << '\n';

    if (!log_dir.empty())
        out << "log_dir=" << log_dir << '\n';
}

std::string trim(const std::string &s)
{
    std::string val = s;
    val.erase(val.begin(), std::find_if(val.begin(), val.end(),
        [] (unsigned char c){ return !std::isspace(c); }));
    val.erase(std::find_if(val.rbegin(), val.rend(),
        [] (unsigned char c){ return !std::isspace(c); }).base(), val.end());
    return val;
}

bool split_setting(const std::string &line, std::string &key, std::string &val)
{
    size_t ret = line.find('=');
    if (ret == std::string::npos)
        return false;

    key = trim(line.substr(0, ret));
    val = trim(line.substr(ret + 1));
    return !key.empty();
}

bool parse_unsigned(const std::string &s, unsigned int &value)
{
    if (s.empty() || s.length() > 9)
        return false;

    for (unsigned int i = 0; i < s.length(); ++i) {
        if (s[i] < '0' || s[i] > '9')
            return false;
    }

    value = static_cast<unsigned int>(strtoul(s.c_str(), NULL, 10));
    return true;
}

bool parse_double(const std::string &s, double &value)
{
    if (s.empty())
        return false;

    char *end;
    errno = 0;
    double d = strtod(s.c_str(), &end);
    if (errno != 0 || *end != '\0' || d != d)
        return false;

    value = d;
    return true;
}

bool parse_bool(const std::string &s, bool &value)
{
    if (s == "true" || s == "yes" || s == "1") {
        value = true;
        return true;
    }
    if (s == "false" || s == "no" || s == "0") {
        value = false;
        return true;
    }

    return false;
}
