#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "bluetooth.hpp"
#include "prober.hpp"
#include <atomic>
#include <memory>
#include <cstdint>
#include <microhttpd.h>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/*
 * Prober answering from a fixed set of "host:port" addresses without
 * touching the network. Tasks settle at their deadline.
 */
class FakeProber : public Prober {
public:
    FakeProber();

    std::unique_ptr<ProbeTask> startProbe(const std::string &host,
                                          const std::vector<PortCandidate> &ports) override;

    void answer(const std::string &address);

    unsigned int probeCount() const { return m_probes; }
    unsigned int peakOutstanding() const { return m_peak; }

    unsigned int delay_ms;      /* time a probe takes */
    bool throw_on_start;
    bool throw_on_process;

private:
    friend class FakeProbeTask;

    std::set<std::string> m_answers;
    std::atomic<unsigned int> m_probes;
    std::atomic<unsigned int> m_outstanding;
    std::atomic<unsigned int> m_peak;
};

class FakeBluetoothAdapter : public BluetoothAdapter {
public:
    FakeBluetoothAdapter();

    bool available() override;
    bool pairedDevices(std::vector<BluetoothPeer> &peers) override;
    bool open(const std::string &address) override;
    bool write(const std::string &data) override;
    void close() override;

    void addPeer(const std::string &address, const std::string &name);

    bool powered;
    bool open_ok;
    unsigned int open_delay_ms;     /* time open() takes */
    bool write_ok;
    bool throw_on_list;
    unsigned int list_count;
    std::vector<BluetoothPeer> peers;
    std::string opened;
    std::string written;
};

/* TCP listener on 127.0.0.1, connections stay in the backlog until drained */
class LoopbackListener {
public:
    LoopbackListener();
    ~LoopbackListener();

    uint16_t port() const { return m_port; }
    std::string address() const;

    /* Next pending connection, -1 when none came within timeout_ms */
    int accept(unsigned int timeout_ms);

    /* Accept pending connections and return everything they sent */
    std::string drain(unsigned int timeout_ms = 200);

    void close();

private:
    int m_fd;
    uint16_t m_port;
};

/*
 * Web server that answers a single request with reply, then stops
 * listening. Later connections to its port are refused.
 */
class SingleReplyServer {
public:
    explicit SingleReplyServer(const std::string &reply);
    ~SingleReplyServer();

    uint16_t port() const { return m_listener.port(); }

    /* Request received, empty until the server answered */
    std::string request();

private:
    void serve();

    LoopbackListener m_listener;
    std::string m_reply;
    std::string m_request;
    std::thread m_thread;
};

/* Port nobody listens on */
uint16_t unused_port();

/*
 * Printer web page: ok_path answers 200, anything else 404, every reply
 * carrying server_header when not empty.
 */
class FakeStatusPage {
public:
    FakeStatusPage(const std::string &ok_path, const std::string &server_header);
    ~FakeStatusPage();

    uint16_t port() const { return m_port; }

    std::string ok_path;
    std::string server_header;
    std::atomic<unsigned int> requests;

private:
    uint16_t m_port;
    struct MHD_Daemon *m_daemon;
};

/* Send a GET request to 127.0.0.1:port and return the whole reply */
std::string http_get(uint16_t port, const std::string &path);

#endif
