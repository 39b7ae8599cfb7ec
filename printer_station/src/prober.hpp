#ifndef PROBER_HPP
#define PROBER_HPP

#include "printer_device.hpp"
#include "topology.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

enum ProbeStrategy {
    PROBE_NONE,
    PROBE_HANDSHAKE,    /* protocol handshake suited to the port */
    PROBE_ENDPOINTS,    /* printer status and info pages */
    PROBE_RAW,          /* plain TCP connection */
};

/* What a probe learnt about an address, used to label it */
struct ProbeEvidence {
    ProbeEvidence();

    ProbeStrategy strategy;     /* strategy that found the address reachable */
    int vendor;                 /* index in the vendor table, -1 if none */
    bool vendor_confirmed;      /* vendor endpoint answered with a success status */
    std::string endpoint;
    std::string server;         /* HTTP Server header */
};

/*
 * Asynchronous probe of one host over a list of ports.
 *
 * The scheduler polls fd() for events() and calls process() with the
 * returned events, or with 0 once deadline() has passed.
 */
class ProbeTask {
public:
    virtual ~ProbeTask() = default;

    /* -1 when the task only waits for its deadline */
    virtual int fd() const = 0;
    virtual short events() const = 0;
    virtual std::chrono::steady_clock::time_point deadline() const = 0;

    virtual void process(short revents) = 0;

    virtual bool finished() const = 0;

    /* Valid once finished */
    virtual bool found() const = 0;
    virtual const PrinterDevice& device() const = 0;
};

class Prober {
public:
    virtual ~Prober() = default;

    /**
     * @brief Start probing host, one port after the other in the given
     * order, stopping at the first port where a printer answers.
     *
     * Failures are reported as a finished task without device.
     */
    virtual std::unique_ptr<ProbeTask> startProbe(const std::string &host,
                                                  const std::vector<PortCandidate> &ports) = 0;

    /**
     * @brief Probe a single host:port and wait for the outcome.
     *
     * @return true and fill device if a printer answers, false otherwise
     */
    bool checkAddress(const std::string &host, const PortCandidate &port, PrinterDevice &device);
};

struct ProbeSlot {
    std::string host;
    std::unique_ptr<ProbeTask> task;
    bool settled;
};

/**
 * @brief Drive all tasks from the calling thread until every one settled.
 *
 * A task throwing from process() is settled without device.
 */
void settle_probe_tasks(std::vector<ProbeSlot> &slots);

#endif
