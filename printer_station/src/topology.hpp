#ifndef TOPOLOGY_HPP
#define TOPOLOGY_HPP

#include <cstdint>
#include <string>
#include <vector>

enum PortProtocol {
    PORT_RAW,       /* raw print data, nothing is ever sent while probing */
    PORT_HTTP,
    PORT_TLS,
};

struct PortCandidate {
    uint16_t port;
    const char *vendor;     /* NULL when the port is not vendor specific */
    const char *label;      /* display label, e.g. "ESC/POS Thermal Printer" */
    PortProtocol protocol;
};

/**
 * @brief Subnet prefixes to sweep, most likely first, without duplicates.
 *
 * Covers common home, office and corporate ranges, link-local ranges
 * and factory defaults of the major receipt printer manufacturers.
 */
const std::vector<std::string>& default_subnets();

/**
 * @brief Candidate printer ports. The most common ports come first
 * so that the first printer is found quickly.
 */
const std::vector<PortCandidate>& default_ports();

/**
 * @brief Host suffixes 1-254, static printer addresses first.
 */
const std::vector<unsigned int>& default_host_suffixes();

/* Look up a port in the port table */
bool lookup_port(uint16_t port, PortCandidate &candidate);

/* Build a port list from port numbers, unknown ports are probed as raw */
std::vector<PortCandidate> make_port_list(const std::vector<uint16_t> &ports);

/* Remove duplicates, first occurrence wins */
std::vector<std::string> dedup_subnets(const std::vector<std::string> &subnets);

/* Check that prefix is made of three dotted octets, e.g. "192.168.1" */
bool check_subnet_prefix(const std::string &prefix);

#endif
