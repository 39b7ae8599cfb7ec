#ifndef IDENTIFIER_HPP
#define IDENTIFIER_HPP

#include "prober.hpp"
#include <cstdint>
#include <string>
#include <vector>

/* Status pages of one vendor, vendor == NULL for generic pages */
struct VendorProfile {
    const char *vendor;
    const char *family_label;       /* used when an endpoint confirmed the vendor */
    const char *generic_label;      /* used when the vendor is only likely */
    std::vector<const char*> endpoints;
    std::vector<uint16_t> ports;    /* HTTP ports serving the pages, empty for any */
    std::vector<const char*> keywords;  /* lower case Server header keywords */
};

/* Vendor table iterated by the prober and the identifier */
const std::vector<VendorProfile>& default_vendor_profiles();

bool vendor_serves_port(const VendorProfile &profile, uint16_t port);

class Identifier {
public:
    Identifier();
    explicit Identifier(const std::vector<VendorProfile> &profiles);

    /**
     * @brief Human readable label of a printer.
     *
     * Vendor endpoint evidence first, then vendor named by the HTTP
     * server, then the port table, then a generic label.
     * Never throws.
     */
    std::string identify(const std::string &host, uint16_t port, const ProbeEvidence &evidence) const;

    /* Label from the port table only */
    std::string identifyByPort(const std::string &host, uint16_t port) const;

    const std::vector<VendorProfile>& profiles() const;

private:
    std::string identifyByEvidence(const std::string &host, const ProbeEvidence &evidence) const;

    std::vector<VendorProfile> m_profiles;
};

#endif
