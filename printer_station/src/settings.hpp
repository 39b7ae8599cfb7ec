#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "capabilities.hpp"
#include "logger.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#define DEFAULT_CONFIG_PATH     "/etc/printer_station.conf"
#define DEFAULT_PREVIEW_PORT    (8080)

/* Station configuration, key=value file */
struct Settings {
    Settings();

    unsigned int batch_size;
    unsigned int batch_delay_ms;
    unsigned int cache_ttl_s;
    unsigned int connect_timeout_ms;    /* connection manager handshake and print job */
    unsigned int attempt_timeout_ms;    /* one probe connection */
    unsigned int handshake_timeout_ms;
    unsigned int endpoint_timeout_ms;
    unsigned int raw_timeout_ms;
    std::vector<std::string> subnets;   /* empty for the default table */
    std::vector<uint16_t> ports;        /* empty for the default table */
    TransportCapabilities capabilities;
    uint16_t preview_port;
    std::string bluetooth_device;
    double credit_card_fee_percent;
    LogLevel log_level;
    std::string log_dir;                /* empty to log to stdout only */

    /**
     * @brief Read settings, invalid values are logged and left to default.
     *
     * @return false if the file cannot be opened
     */
    bool load(const std::string &path);
    void parse(std::istream &in);

    bool save(const std::string &path) const;
    void write(std::ostream &out) const;
};

std::string trim(const std::string &s);

/* Split "key = value", false on lines without '=' or with an empty key */
bool split_setting(const std::string &line, std::string &key, std::string &val);

bool parse_unsigned(const std::string &s, unsigned int &value);
bool parse_double(const std::string &s, double &value);
bool parse_bool(const std::string &s, bool &value);

#endif
