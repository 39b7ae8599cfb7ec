#include "tcp_prober.hpp"
#include "logger.hpp"
#include "net.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#define MAX_REPLY_SIZE              (4096)

namespace {

typedef std::chrono::steady_clock Clock;

enum Phase {
    PHASE_IDLE,
    PHASE_CONNECTING,
    PHASE_SENDING,
    PHASE_RECEIVING,
};

struct ProbeStep {
    std::string path;   /* empty for a plain connection */
    int vendor;
};

int parse_status_code(const std::string &reply)
{
    if (reply.compare(0, 5, "HTTP/") != 0)
        return 0;

    size_t pos = reply.find(' ');
    if (pos == std::string::npos)
        return 0;

    return atoi(reply.c_str() + pos + 1);
}

std::string parse_server_header(const std::string &reply)
{
    std::istringstream lines(reply);
    std::string line;

    while (std::getline(lines, line)) {
        if (!line.empty() && line[line.length() - 1] == '\r')
            line.erase(line.length() - 1);
        if (line.empty())
            break;
        if (line.length() < 7)
            continue;

        std::string key = line.substr(0, 7);
        std::transform(key.begin(), key.end(), key.begin(),
                       [] (unsigned char c){ return std::tolower(c); });
        if (key != "server:")
            continue;

        std::string val = line.substr(7);
        val.erase(val.begin(), std::find_if(val.begin(), val.end(),
            [] (unsigned char c){ return !std::isspace(c); }));
        return val;
    }

    return std::string();
}

class TcpProbeTask : public ProbeTask {
public:
    TcpProbeTask(const Identifier &identifier, ProbeStrategySet strategies,
                 const ProbeTimeouts &timeouts, const std::string &host,
                 const std::vector<PortCandidate> &ports);
    ~TcpProbeTask();

    int fd() const override { return m_fd; }
    short events() const override;
    Clock::time_point deadline() const override { return m_step_deadline; }

    void process(short revents) override;

    bool finished() const override { return m_finished; }
    bool found() const override { return m_found; }
    const PrinterDevice& device() const override { return m_device; }

private:
    void startPort();
    void nextPort();
    void startStrategy(ProbeStrategy strategy);
    void endStrategy();
    void startStep();
    void nextStep();

    void onConnected();
    void onConnectFailed(ConnectStatus status, int error);
    void onTimeout();
    void onReply();
    void onLiveSignal();

    void writeRequest();
    void readReply();

    void markReachable();
    void succeed();
    void hostAbsent(const char *reason);
    void finish();
    void closeSocket();

    unsigned int strategyBudget(ProbeStrategy strategy) const;
    const PortCandidate& port() const { return m_ports[m_port_index]; }
    const ProbeStep& step() const { return m_steps[m_step_index]; }

    const Identifier &m_identifier;
    ProbeStrategySet m_strategies;
    ProbeTimeouts m_timeouts;
    std::string m_host;
    std::vector<PortCandidate> m_ports;
    size_t m_port_index;

    ProbeStrategy m_strategy;
    std::vector<ProbeStep> m_steps;
    size_t m_step_index;
    Clock::time_point m_strategy_deadline;
    Clock::time_point m_attempt_deadline;
    Clock::time_point m_step_deadline;

    int m_fd;
    Phase m_phase;
    std::string m_request;
    size_t m_sent;
    std::string m_reply;

    bool m_reachable;
    ProbeEvidence m_evidence;

    bool m_finished;
    bool m_found;
    PrinterDevice m_device;
};

TcpProbeTask::TcpProbeTask(const Identifier &identifier, ProbeStrategySet strategies,
                           const ProbeTimeouts &timeouts, const std::string &host,
                           const std::vector<PortCandidate> &ports):
m_identifier(identifier),
m_strategies(strategies),
m_timeouts(timeouts),
m_host(host),
m_ports(ports),
m_port_index(0),
m_strategy(PROBE_NONE),
m_steps(),
m_step_index(0),
m_strategy_deadline(Clock::now()),
m_attempt_deadline(Clock::now()),
m_step_deadline(Clock::now()),
m_fd(-1),
m_phase(PHASE_IDLE),
m_request(),
m_sent(0),
m_reply(),
m_reachable(false),
m_evidence(),
m_finished(false),
m_found(false),
m_device()
{
    struct in_addr addr;
    if (inet_pton(AF_INET, m_host.c_str(), &addr) != 1) {
        std::stringstream ss;
        ss << "Not probing invalid address \"" << m_host << '"';
        Logger::debug(ss.str());
        finish();
        return;
    }

    startPort();
}

TcpProbeTask::~TcpProbeTask()
{
    closeSocket();
}

short TcpProbeTask::events() const
{
    switch (m_phase) {
    case PHASE_CONNECTING:
    case PHASE_SENDING:
        return POLLOUT;
    case PHASE_RECEIVING:
        return POLLIN;
    default:
        return 0;
    }
}

void TcpProbeTask::process(short revents)
{
    if (m_finished)
        return;

    if (revents == 0) {
        onTimeout();
        return;
    }

    switch (m_phase) {
    case PHASE_CONNECTING: {
        int error;
        ConnectStatus status = tcp_connect_finish(m_fd, error);
        if (status == CONNECT_IN_PROGRESS)
            return;
        if (status == CONNECT_OK) {
            onConnected();
        } else {
            closeSocket();
            onConnectFailed(status, error);
        }
        break;
    }
    case PHASE_SENDING:
        writeRequest();
        break;
    case PHASE_RECEIVING:
        readReply();
        break;
    default:
        finish();
        break;
    }
}

void TcpProbeTask::startPort()
{
    if (m_port_index >= m_ports.size()) {
        finish();
        return;
    }

    m_reachable = false;
    m_evidence = ProbeEvidence();
    startStrategy(PROBE_HANDSHAKE);
}

void TcpProbeTask::nextPort()
{
    m_port_index++;
    startPort();
}

void TcpProbeTask::startStrategy(ProbeStrategy strategy)
{
    const PortCandidate &p = port();

    m_strategy = strategy;
    m_steps.clear();
    m_step_index = 0;

    if (strategy == PROBE_HANDSHAKE) {
        ProbeStep s;
        s.path = p.protocol == PORT_HTTP ? "/" : "";
        s.vendor = -1;
        m_steps.push_back(s);
    } else if (strategy == PROBE_ENDPOINTS) {
        /* Never send anything to raw print ports */
        if (p.protocol == PORT_HTTP) {
            const std::vector<VendorProfile> &profiles = m_identifier.profiles();
            for (size_t i = 0; i < profiles.size(); ++i) {
                if (!vendor_serves_port(profiles[i], p.port))
                    continue;
                for (auto endpoint : profiles[i].endpoints) {
                    ProbeStep s;
                    s.path = endpoint;
                    s.vendor = static_cast<int>(i);
                    m_steps.push_back(s);
                }
            }
        }
    } else {
        ProbeStep s;
        s.vendor = -1;
        m_steps.push_back(s);
    }

    m_strategy_deadline = Clock::now() + std::chrono::milliseconds(strategyBudget(strategy));
    startStep();
}

void TcpProbeTask::endStrategy()
{
    switch (m_strategy) {
    case PROBE_HANDSHAKE:
        if (port().protocol == PORT_HTTP)
            startStrategy(PROBE_ENDPOINTS);
        else if (m_reachable)
            succeed();
        else
            startStrategy(PROBE_RAW);
        break;
    case PROBE_ENDPOINTS:
        if (m_reachable)
            succeed();
        else
            startStrategy(PROBE_RAW);
        break;
    case PROBE_RAW:
        if (m_reachable)
            succeed();
        else
            nextPort();
        break;
    default:
        finish();
        break;
    }
}

void TcpProbeTask::startStep()
{
    auto now = Clock::now();

    if (m_step_index >= m_steps.size() || now >= m_strategy_deadline) {
        endStrategy();
        return;
    }

    m_request.clear();
    m_sent = 0;
    m_reply.clear();
    m_attempt_deadline = now + std::chrono::milliseconds(m_timeouts.attempt_ms);
    m_step_deadline = std::min(m_attempt_deadline, m_strategy_deadline);

    int fd;
    int error;
    ConnectStatus status = tcp_connect_start(m_host, port().port, fd, error);
    switch (status) {
    case CONNECT_OK:
        m_fd = fd;
        onConnected();
        break;
    case CONNECT_IN_PROGRESS:
        m_fd = fd;
        m_phase = PHASE_CONNECTING;
        break;
    default:
        onConnectFailed(status, error);
        break;
    }
}

void TcpProbeTask::nextStep()
{
    m_step_index++;
    startStep();
}

void TcpProbeTask::onConnected()
{
    if (step().path.empty()) {
        closeSocket();
        markReachable();
        endStrategy();
        return;
    }

    std::stringstream ss;
    ss << "HEAD " << step().path << " HTTP/1.0\r\n"
       << "Host: " << m_host << ':' << port().port << "\r\n"
       << "User-Agent: printer_station\r\n"
       << "Connection: close\r\n"
       << "\r\n";
    m_request = ss.str();
    m_sent = 0;
    m_phase = PHASE_SENDING;
    writeRequest();
}

void TcpProbeTask::onConnectFailed(ConnectStatus status, int error)
{
    switch (status) {
    case CONNECT_REFUSED:
        if (m_strategies == PROBE_SANDBOXED) {
            onLiveSignal();
        } else if (m_reachable) {
            /* Port answered an earlier step and stopped listening since */
            endStrategy();
        } else {
            /* Host is up but the port is closed */
            nextPort();
        }
        break;
    case CONNECT_UNREACHABLE:
        if (m_reachable)
            endStrategy();
        else
            hostAbsent("unreachable");
        break;
    default: {
        std::stringstream ss;
        ss << "Connection to " << m_host << ':' << port().port
           << " failed, error " << error;
        Logger::debug(ss.str());
        nextStep();
        break;
    }
    }
}

void TcpProbeTask::onTimeout()
{
    Phase phase = m_phase;
    closeSocket();

    if (phase == PHASE_CONNECTING) {
        /* Neither accepted nor refused: nobody answers at this address */
        if (m_reachable)
            endStrategy();
        else if (Clock::now() >= m_attempt_deadline)
            hostAbsent("connection timed out");
        else
            endStrategy();
    } else if (phase == PHASE_SENDING || phase == PHASE_RECEIVING) {
        if (!m_reply.empty())
            onReply();
        else
            onLiveSignal();
    } else {
        finish();
    }
}

void TcpProbeTask::onReply()
{
    int status = parse_status_code(m_reply);
    std::string server = parse_server_header(m_reply);
    closeSocket();

    if (!server.empty() && m_evidence.server.empty())
        m_evidence.server = server;

    markReachable();

    if (m_strategy != PROBE_ENDPOINTS) {
        endStrategy();
        return;
    }

    if (status > 0 && status < 400) {
        const VendorProfile &profile = m_identifier.profiles().at(step().vendor);
        if (profile.vendor) {
            m_evidence.vendor = step().vendor;
            m_evidence.vendor_confirmed = true;
        }
        m_evidence.endpoint = step().path;
        endStrategy();
        return;
    }

    nextStep();
}

/* Connection accepted then reset or silent, or refused in sandboxed mode */
void TcpProbeTask::onLiveSignal()
{
    closeSocket();
    markReachable();

    if (m_strategy != PROBE_ENDPOINTS) {
        endStrategy();
        return;
    }

    if (m_strategies == PROBE_SANDBOXED && m_evidence.vendor < 0) {
        const VendorProfile &profile = m_identifier.profiles().at(step().vendor);
        if (profile.vendor) {
            m_evidence.vendor = step().vendor;
            m_evidence.endpoint = step().path;
        }
    }

    nextStep();
}

void TcpProbeTask::writeRequest()
{
    while (m_sent < m_request.length()) {
        ssize_t n = send(m_fd, m_request.data() + m_sent, m_request.length() - m_sent,
                         MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                return;
            onLiveSignal();
            return;
        }
        m_sent += n;
    }

    m_phase = PHASE_RECEIVING;
}

void TcpProbeTask::readReply()
{
    char buf[1024];

    ssize_t n = recv(m_fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) {
        m_reply.append(buf, n);
        if (m_reply.find("\r\n\r\n") != std::string::npos || m_reply.length() >= MAX_REPLY_SIZE)
            onReply();
        return;
    }

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        return;

    /* Closed or reset */
    if (!m_reply.empty())
        onReply();
    else
        onLiveSignal();
}

void TcpProbeTask::markReachable()
{
    if (!m_reachable)
        m_evidence.strategy = m_strategy;
    m_reachable = true;
}

void TcpProbeTask::succeed()
{
    const PortCandidate &p = port();

    m_device = make_network_device(m_host, p.port, m_identifier.identify(m_host, p.port, m_evidence));
    m_found = true;

    {
        std::stringstream ss;
        ss << "Found printer \"" << m_device.name << "\" at " << m_device.address;
        Logger::info(ss.str());
    }

    finish();
}

void TcpProbeTask::hostAbsent(const char *reason)
{
    std::stringstream ss;
    ss << "Host " << m_host << " absent (" << reason << " on port " << port().port << ')';
    Logger::debug(ss.str());
    finish();
}

void TcpProbeTask::finish()
{
    closeSocket();
    m_finished = true;
    m_step_deadline = Clock::now();
}

void TcpProbeTask::closeSocket()
{
    if (m_fd >= 0) {
        close(m_fd);
        m_fd = -1;
    }
    m_phase = PHASE_IDLE;
}

unsigned int TcpProbeTask::strategyBudget(ProbeStrategy strategy) const
{
    switch (strategy) {
    case PROBE_HANDSHAKE: return m_timeouts.handshake_ms;
    case PROBE_ENDPOINTS: return m_timeouts.endpoint_ms;
    case PROBE_RAW: return m_timeouts.raw_ms;
    default: return m_timeouts.attempt_ms;
    }
}

}

ProbeTimeouts::ProbeTimeouts():
attempt_ms(DEFAULT_ATTEMPT_TIMEOUT),
handshake_ms(DEFAULT_HANDSHAKE_TIMEOUT),
endpoint_ms(DEFAULT_ENDPOINT_TIMEOUT),
raw_ms(DEFAULT_RAW_TIMEOUT)
{

}

TcpProber::TcpProber(const Identifier &identifier, ProbeStrategySet strategies,
                     const ProbeTimeouts &timeouts):
m_identifier(identifier),
m_strategies(strategies),
m_timeouts(timeouts)
{

}

std::unique_ptr<ProbeTask> TcpProber::startProbe(const std::string &host,
                                                 const std::vector<PortCandidate> &ports)
{
    return std::unique_ptr<ProbeTask>(new TcpProbeTask(m_identifier, m_strategies,
                                                       m_timeouts, host, ports));
}
