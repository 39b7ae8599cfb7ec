#include "topology.hpp"
#include <cstdlib>
#include <set>
#include <string>
#include <vector>

namespace {

#define STAR_LABEL      "Star Micronics Receipt Printer"
#define EPSON_LABEL     "Epson Receipt Printer"
#define CITIZEN_LABEL   "Citizen Receipt Printer"
#define BIXOLON_LABEL   "Bixolon Receipt Printer"
#define BROTHER_LABEL   "Brother Receipt Printer"
#define ZEBRA_LABEL     "Zebra Receipt Printer"
#define ESCPOS_LABEL    "ESC/POS Thermal Printer"

const PortCandidate PORT_TABLE[] = {
    /* Most common first */
    { 9100, NULL, ESCPOS_LABEL, PORT_RAW },
    { 9101, NULL, ESCPOS_LABEL, PORT_RAW },
    { 9102, NULL, ESCPOS_LABEL, PORT_RAW },
    { 3001, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 3002, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 3003, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 10001, "Epson", EPSON_LABEL, PORT_RAW },
    { 8001, "Epson", EPSON_LABEL, PORT_RAW },
    { 631, NULL, "IPP Receipt Printer", PORT_HTTP },
    { 515, NULL, "LPR Receipt Printer", PORT_RAW },

    { 9103, NULL, ESCPOS_LABEL, PORT_RAW },
    { 9104, NULL, ESCPOS_LABEL, PORT_RAW },
    { 9105, NULL, ESCPOS_LABEL, PORT_RAW },
    { 3004, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 3005, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 3006, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 3007, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 3008, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 10002, "Epson", EPSON_LABEL, PORT_RAW },
    { 10003, "Epson", EPSON_LABEL, PORT_RAW },
    { 10004, "Epson", EPSON_LABEL, PORT_RAW },
    { 10005, "Epson", EPSON_LABEL, PORT_RAW },
    { 8002, "Epson", EPSON_LABEL, PORT_RAW },
    { 8003, "Epson", EPSON_LABEL, PORT_RAW },
    { 8004, "Epson", EPSON_LABEL, PORT_RAW },
    { 8005, "Epson", EPSON_LABEL, PORT_RAW },

    /* Web based printers */
    { 80, NULL, "HTTP Receipt Printer", PORT_HTTP },
    { 443, NULL, "HTTPS Receipt Printer", PORT_TLS },
    { 8080, NULL, "Web Receipt Printer", PORT_HTTP },
    { 8443, NULL, "Secure Web Receipt Printer", PORT_TLS },

    { 4001, "Citizen", CITIZEN_LABEL, PORT_RAW },
    { 4002, "Citizen", CITIZEN_LABEL, PORT_RAW },
    { 4003, "Citizen", CITIZEN_LABEL, PORT_RAW },
    { 4004, "Citizen", CITIZEN_LABEL, PORT_RAW },
    { 5001, "Bixolon", BIXOLON_LABEL, PORT_RAW },
    { 5002, "Bixolon", BIXOLON_LABEL, PORT_RAW },
    { 5003, "Bixolon", BIXOLON_LABEL, PORT_RAW },
    { 5004, "Bixolon", BIXOLON_LABEL, PORT_RAW },
    { 6001, "Brother", BROTHER_LABEL, PORT_RAW },
    { 6002, "Brother", BROTHER_LABEL, PORT_RAW },
    { 6003, "Brother", BROTHER_LABEL, PORT_RAW },
    { 6101, "Zebra", ZEBRA_LABEL, PORT_RAW },
    { 6102, "Zebra", ZEBRA_LABEL, PORT_RAW },
    { 6103, "Zebra", ZEBRA_LABEL, PORT_RAW },

    /* Legacy */
    { 23, NULL, "Telnet Receipt Printer", PORT_RAW },
    { 9600, NULL, "Ethernet Receipt Printer", PORT_RAW },
    { 7001, NULL, "Network Receipt Printer", PORT_RAW },
    { 7002, NULL, "Network Receipt Printer", PORT_RAW },

    { 11000, "Epson", EPSON_LABEL, PORT_RAW },
    { 11001, "Epson", EPSON_LABEL, PORT_RAW },
    { 11002, "Epson", EPSON_LABEL, PORT_RAW },
    { 12000, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 12001, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 12002, "Star Micronics", STAR_LABEL, PORT_RAW },
    { 13000, NULL, "Specialty Receipt Printer", PORT_RAW },
    { 13001, NULL, "Specialty Receipt Printer", PORT_RAW },
    { 13002, NULL, "Specialty Receipt Printer", PORT_RAW },
};

/* Manufacturer defaults repeat some of the common ranges */
const char *SUBNET_TABLE[] = {
    /* Home and office */
    "192.168.1", "192.168.0", "192.168.2", "192.168.3", "192.168.4",
    "192.168.5", "192.168.10", "192.168.11", "192.168.20", "192.168.100",
    "192.168.50", "192.168.101", "192.168.200",

    /* Corporate */
    "10.0.0", "10.0.1", "10.1.1", "10.10.10", "10.1.10", "10.0.10",
    "10.0.50", "10.1.0", "10.2.0", "10.10.0", "10.20.0",
    "172.16.1", "172.16.0", "172.20.10", "172.16.10", "172.16.50",

    /* Link-local, common for ethernet printers */
    "169.254.1", "169.254.2", "169.254.10", "169.254.100",

    /* Star Micronics */
    "192.168.192", "10.0.0", "192.168.1", "172.16.1",

    /* Epson */
    "192.168.192", "192.168.223", "10.0.50", "172.16.254",
    "192.168.11", "10.1.1", "172.20.1",

    /* Citizen */
    "192.168.1", "10.0.0", "172.16.0",

    /* Bixolon */
    "192.168.1", "10.0.1", "172.16.1",

    /* Brother */
    "192.168.1", "10.0.0", "169.254.1",

    "192.168.254", "10.254.254", "172.31.1",
};

/* [first, last] blocks of host suffixes, in priority order */
const unsigned int SUFFIX_BLOCKS[][2] = {
    /* Very common static printer addresses */
    { 200, 209 }, { 100, 109 }, { 50, 59 }, { 10, 19 },

    /* Router and gateway range */
    { 1, 9 },

    /* Common static assignments */
    { 20, 25 }, { 30, 35 }, { 40, 45 }, { 60, 65 }, { 70, 75 },
    { 80, 85 }, { 90, 95 },

    /* DHCP ranges */
    { 110, 129 }, { 130, 149 }, { 150, 169 }, { 170, 189 }, { 190, 199 },

    /* End of range */
    { 210, 229 }, { 230, 249 }, { 250, 254 },

    /* Anything not covered above */
    { 1, 254 },
};

std::vector<PortCandidate> build_ports()
{
    return std::vector<PortCandidate>(PORT_TABLE,
                                      PORT_TABLE + sizeof(PORT_TABLE) / sizeof(PORT_TABLE[0]));
}

std::vector<unsigned int> build_suffixes()
{
    std::vector<unsigned int> suffixes;
    std::set<unsigned int> seen;

    for (unsigned int i = 0; i < sizeof(SUFFIX_BLOCKS) / sizeof(SUFFIX_BLOCKS[0]); ++i) {
        for (unsigned int s = SUFFIX_BLOCKS[i][0]; s <= SUFFIX_BLOCKS[i][1]; ++s) {
            if (s >= 1 && s <= 254 && seen.insert(s).second)
                suffixes.push_back(s);
        }
    }

    return suffixes;
}

}

const std::vector<std::string>& default_subnets()
{
    static const std::vector<std::string> subnets = dedup_subnets(
        std::vector<std::string>(SUBNET_TABLE,
                                 SUBNET_TABLE + sizeof(SUBNET_TABLE) / sizeof(SUBNET_TABLE[0])));
    return subnets;
}

const std::vector<PortCandidate>& default_ports()
{
    static const std::vector<PortCandidate> ports = build_ports();
    return ports;
}

const std::vector<unsigned int>& default_host_suffixes()
{
    static const std::vector<unsigned int> suffixes = build_suffixes();
    return suffixes;
}

bool lookup_port(uint16_t port, PortCandidate &candidate)
{
    for (unsigned int i = 0; i < sizeof(PORT_TABLE) / sizeof(PORT_TABLE[0]); ++i) {
        if (PORT_TABLE[i].port == port) {
            candidate = PORT_TABLE[i];
            return true;
        }
    }

    return false;
}

std::vector<PortCandidate> make_port_list(const std::vector<uint16_t> &ports)
{
    std::vector<PortCandidate> candidates;
    std::set<uint16_t> seen;

    for (auto port : ports) {
        if (!seen.insert(port).second)
            continue;

        PortCandidate candidate;
        if (!lookup_port(port, candidate)) {
            candidate.port = port;
            candidate.vendor = NULL;
            candidate.label = NULL;
            candidate.protocol = PORT_RAW;
        }
        candidates.push_back(candidate);
    }

    return candidates;
}

std::vector<std::string> dedup_subnets(const std::vector<std::string> &subnets)
{
    std::vector<std::string> unique;
    std::set<std::string> seen;

    for (auto &s : subnets) {
        if (seen.insert(s).second)
            unique.push_back(s);
    }

    return unique;
}

bool check_subnet_prefix(const std::string &prefix)
{
    unsigned int octets = 0;
    size_t start = 0;

    while (start <= prefix.length()) {
        size_t end = prefix.find('.', start);
        if (end == std::string::npos)
            end = prefix.length();

        std::string octet = prefix.substr(start, end - start);
        if (octet.empty() || octet.length() > 3)
            return false;
        for (unsigned int i = 0; i < octet.length(); ++i) {
            if (octet[i] < '0' || octet[i] > '9')
                return false;
        }
        if (atoi(octet.c_str()) > 255)
            return false;

        octets++;
        start = end + 1;
    }

    return octets == 3;
}
