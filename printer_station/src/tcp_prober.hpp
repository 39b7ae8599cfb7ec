#ifndef TCP_PROBER_HPP
#define TCP_PROBER_HPP

#include "capabilities.hpp"
#include "identifier.hpp"
#include "prober.hpp"
#include <memory>
#include <string>
#include <vector>

#define DEFAULT_ATTEMPT_TIMEOUT     (2000)  /* in milliseconds */
#define DEFAULT_HANDSHAKE_TIMEOUT   (4000)  /* in milliseconds */
#define DEFAULT_ENDPOINT_TIMEOUT    (5000)  /* in milliseconds */
#define DEFAULT_RAW_TIMEOUT         (2000)  /* in milliseconds */

/* Time budgets of the probe strategies, in milliseconds */
struct ProbeTimeouts {
    ProbeTimeouts();

    unsigned int attempt_ms;    /* one connection and its exchange */
    unsigned int handshake_ms;
    unsigned int endpoint_ms;
    unsigned int raw_ms;
};

/*
 * Probes hosts with real TCP connections.
 *
 * For each port, in order:
 *  1. handshake: connect, and on HTTP ports send HEAD / expecting any reply
 *  2. status endpoints: HEAD each vendor page on HTTP ports
 *  3. raw: plain connect
 *
 * A timed out or unreachable connection means the host is absent and ends
 * the probe. A refused connection means a closed port, unless the
 * sandboxed strategy set is used.
 */
class TcpProber : public Prober {
public:
    TcpProber(const Identifier &identifier, ProbeStrategySet strategies,
              const ProbeTimeouts &timeouts = ProbeTimeouts());

    std::unique_ptr<ProbeTask> startProbe(const std::string &host,
                                          const std::vector<PortCandidate> &ports) override;

private:
    const Identifier &m_identifier;
    ProbeStrategySet m_strategies;
    ProbeTimeouts m_timeouts;
};

#endif
