#include "capabilities.hpp"

bool parse_probe_strategy(const std::string &s, ProbeStrategySet &strategy)
{
    if (s == "native")
        strategy = PROBE_NATIVE;
    else if (s == "sandboxed")
        strategy = PROBE_SANDBOXED;
    else
        return false;

    return true;
}

std::string probe_strategy_to_string(ProbeStrategySet strategy)
{
    switch (strategy) {
    case PROBE_NATIVE: return "native";
    case PROBE_SANDBOXED: return "sandboxed";
    default: return "unknown";
    }
}
