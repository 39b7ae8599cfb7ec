#include "identifier.hpp"
#include "logger.hpp"
#include "topology.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<VendorProfile> build_profiles()
{
    std::vector<VendorProfile> profiles;

    {
        VendorProfile p;
        p.vendor = "Star Micronics";
        p.family_label = "Star Micronics TSP Printer";
        p.generic_label = "Star Micronics Receipt Printer";
        p.endpoints = { "/StarWebPRNT/status", "/StarWebPRNT/info" };
        p.ports = { 80, 8080 };
        p.keywords = { "star micronics", "starwebprnt", "tsp" };
        profiles.push_back(p);
    }

    {
        VendorProfile p;
        p.vendor = "Epson";
        p.family_label = "Epson TM Series Printer";
        p.generic_label = "Epson Receipt Printer";
        p.endpoints = { "/PRESENTATION/ADVANCED", "/cgi-bin/epos/service.cgi", "/info.xml" };
        p.ports = { 80, 8008, 8080 };
        p.keywords = { "epson", "epos" };
        profiles.push_back(p);
    }

    {
        VendorProfile p;
        p.vendor = "Citizen";
        p.family_label = "Citizen CT Series Printer";
        p.generic_label = "Citizen Receipt Printer";
        p.endpoints = { "/printer_status" };
        p.ports = { 80 };
        p.keywords = { "citizen" };
        profiles.push_back(p);
    }

    {
        VendorProfile p;
        p.vendor = "Bixolon";
        p.family_label = "Bixolon SRP Series Printer";
        p.generic_label = "Bixolon Receipt Printer";
        p.endpoints = { "/WebPRNT/status" };
        p.ports = { 80 };
        p.keywords = { "bixolon", "srp" };
        profiles.push_back(p);
    }

    /* Pages served by any network printer */
    {
        VendorProfile p;
        p.vendor = NULL;
        p.family_label = NULL;
        p.generic_label = NULL;
        p.endpoints = { "/status", "/info", "/printer", "/cgi-bin/status", "/status.xml" };
        profiles.push_back(p);
    }

    return profiles;
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [] (unsigned char c){ return std::tolower(c); });
    return s;
}

std::string with_host(const char *label, const std::string &host)
{
    std::stringstream ss;
    ss << label << " (" << host << ')';
    return ss.str();
}

}

const std::vector<VendorProfile>& default_vendor_profiles()
{
    static const std::vector<VendorProfile> profiles = build_profiles();
    return profiles;
}

bool vendor_serves_port(const VendorProfile &profile, uint16_t port)
{
    if (profile.ports.empty())
        return true;

    return std::find(profile.ports.begin(), profile.ports.end(), port) != profile.ports.end();
}

Identifier::Identifier():
m_profiles(default_vendor_profiles())
{

}

Identifier::Identifier(const std::vector<VendorProfile> &profiles):
m_profiles(profiles)
{

}

std::string Identifier::identify(const std::string &host, uint16_t port, const ProbeEvidence &evidence) const
{
    try {
        std::string name = identifyByEvidence(host, evidence);
        if (!name.empty())
            return name;
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Failed to identify printer at " << host << ':' << port << ": " << e.what();
        Logger::debug(ss.str());
    }

    return identifyByPort(host, port);
}

std::string Identifier::identifyByEvidence(const std::string &host, const ProbeEvidence &evidence) const
{
    if (evidence.vendor >= 0) {
        const VendorProfile &p = m_profiles.at(evidence.vendor);
        if (p.vendor) {
            if (evidence.vendor_confirmed && p.family_label)
                return with_host(p.family_label, host);
            if (p.generic_label)
                return with_host(p.generic_label, host);
        }
    }

    if (!evidence.server.empty()) {
        std::string server = to_lower(evidence.server);
        for (auto &p : m_profiles) {
            if (!p.vendor || !p.generic_label)
                continue;
            for (auto keyword : p.keywords) {
                if (server.find(keyword) != std::string::npos)
                    return with_host(p.generic_label, host);
            }
        }
    }

    return std::string();
}

std::string Identifier::identifyByPort(const std::string &host, uint16_t port) const
{
    PortCandidate candidate;
    if (lookup_port(port, candidate) && candidate.label)
        return with_host(candidate.label, host);

    std::stringstream ss;
    ss << "Network Receipt Printer (" << host << ':' << port << ')';
    return ss.str();
}

const std::vector<VendorProfile>& Identifier::profiles() const
{
    return m_profiles;
}
