#ifndef CAPABILITIES_HPP
#define CAPABILITIES_HPP

#include <string>

enum ProbeStrategySet {
    PROBE_NATIVE,       /* connection refused means the port is closed */
    PROBE_SANDBOXED,    /* any error but unreachable means a live listener */
};

/* What the runtime can do, supplied at construction */
struct TransportCapabilities {
    TransportCapabilities():
    supports_bluetooth(false),
    probe_strategy(PROBE_NATIVE),
    preview_only(false)
    {

    }

    bool supports_bluetooth;
    ProbeStrategySet probe_strategy;
    bool preview_only;      /* print through the preview page only */
};

bool parse_probe_strategy(const std::string &s, ProbeStrategySet &strategy);
std::string probe_strategy_to_string(ProbeStrategySet strategy);

#endif
