#include <catch2/catch.hpp>
#include <chrono>
#include "identifier.hpp"
#include "tcp_prober.hpp"
#include "test_helpers.hpp"

namespace {

ProbeTimeouts short_timeouts()
{
    ProbeTimeouts timeouts;
    timeouts.attempt_ms = 300;
    timeouts.handshake_ms = 500;
    timeouts.endpoint_ms = 1000;
    timeouts.raw_ms = 300;
    return timeouts;
}

PortCandidate http_port(uint16_t port)
{
    PortCandidate candidate;
    candidate.port = port;
    candidate.vendor = NULL;
    candidate.label = NULL;
    candidate.protocol = PORT_HTTP;
    return candidate;
}

std::vector<VendorProfile> test_profiles()
{
    std::vector<VendorProfile> profiles;

    VendorProfile star;
    star.vendor = "Star Micronics";
    star.family_label = "Star Micronics TSP Printer";
    star.generic_label = "Star Micronics Receipt Printer";
    star.endpoints = { "/StarWebPRNT/status" };
    star.keywords = { "star micronics" };
    profiles.push_back(star);

    VendorProfile epson;
    epson.vendor = "Epson";
    epson.family_label = "Epson TM Series Printer";
    epson.generic_label = "Epson Receipt Printer";
    epson.endpoints = { "/cgi-bin/epos/service.cgi" };
    epson.keywords = { "epson" };
    profiles.push_back(epson);

    VendorProfile generic;
    generic.vendor = NULL;
    generic.family_label = NULL;
    generic.generic_label = NULL;
    generic.endpoints = { "/status" };
    profiles.push_back(generic);

    return profiles;
}

}

TEST_CASE("Raw port with a listener is a printer", "[prober]")
{
    LoopbackListener listener;
    Identifier identifier;
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());

    std::vector<PortCandidate> ports = make_port_list({ listener.port() });
    PrinterDevice device;

    REQUIRE(prober.checkAddress("127.0.0.1", ports[0], device));
    CHECK(device.address == listener.address());
    CHECK(device.transport == TRANSPORT_NETWORK);
    CHECK(device.name == "Network Receipt Printer (" + listener.address() + ")");

    /* Nothing is ever written to raw print ports */
    CHECK(listener.drain().empty());
}

TEST_CASE("Closed port is not a printer", "[prober]")
{
    Identifier identifier;
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());

    std::vector<PortCandidate> ports = make_port_list({ unused_port() });
    PrinterDevice device;

    CHECK_FALSE(prober.checkAddress("127.0.0.1", ports[0], device));
}

TEST_CASE("Refused connection is a live listener in sandboxed mode", "[prober]")
{
    Identifier identifier;
    TcpProber prober(identifier, PROBE_SANDBOXED, short_timeouts());

    std::vector<PortCandidate> ports = make_port_list({ unused_port() });
    PrinterDevice device;

    CHECK(prober.checkAddress("127.0.0.1", ports[0], device));
}

TEST_CASE("First answering port wins", "[prober]")
{
    LoopbackListener first;
    LoopbackListener second;
    Identifier identifier;
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());

    std::vector<ProbeSlot> slots(1);
    slots[0].host = "127.0.0.1";
    slots[0].task = prober.startProbe("127.0.0.1", make_port_list({ unused_port(), first.port(), second.port() }));
    slots[0].settled = slots[0].task->finished();

    settle_probe_tasks(slots);

    REQUIRE(slots[0].task);
    REQUIRE(slots[0].task->found());
    CHECK(slots[0].task->device().address == first.address());
}

TEST_CASE("Invalid host is not probed", "[prober]")
{
    Identifier identifier;
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());

    std::unique_ptr<ProbeTask> task = prober.startProbe("not-an-address", default_ports());

    REQUIRE(task);
    CHECK(task->finished());
    CHECK_FALSE(task->found());
}

TEST_CASE("Absent host skips its remaining ports", "[prober]")
{
    Identifier identifier;
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());

    auto start = std::chrono::steady_clock::now();

    std::vector<ProbeSlot> slots(1);
    slots[0].host = "192.0.2.1";
    slots[0].task = prober.startProbe("192.0.2.1", make_port_list({ 9100, 9101, 9102, 3001, 3002, 3003 }));
    slots[0].settled = slots[0].task->finished();
    settle_probe_tasks(slots);

    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(slots[0].task);
    CHECK_FALSE(slots[0].task->found());
    CHECK(elapsed < std::chrono::milliseconds(1500));
}

TEST_CASE("Vendor status endpoint confirms the model family", "[prober]")
{
    FakeStatusPage page("/StarWebPRNT/status", "");
    Identifier identifier(test_profiles());
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());
    PrinterDevice device;

    REQUIRE(prober.checkAddress("127.0.0.1", http_port(page.port()), device));
    CHECK(device.name == "Star Micronics TSP Printer (127.0.0.1)");
    CHECK(page.requests.load() >= 2);
}

TEST_CASE("Server header identifies the vendor when no endpoint answers", "[prober]")
{
    FakeStatusPage page("/nothing-here", "EPSON_Link");
    Identifier identifier(test_profiles());
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());
    PrinterDevice device;

    REQUIRE(prober.checkAddress("127.0.0.1", http_port(page.port()), device));
    CHECK(device.name == "Epson Receipt Printer (127.0.0.1)");
}

TEST_CASE("Generic status page keeps the port label", "[prober]")
{
    FakeStatusPage page("/status", "");
    Identifier identifier(test_profiles());
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());
    PrinterDevice device;

    REQUIRE(prober.checkAddress("127.0.0.1", http_port(page.port()), device));
    CHECK(device.name == "Network Receipt Printer (127.0.0.1:" + std::to_string(page.port()) + ")");
}

TEST_CASE("Web server that stops listening after answering stays a printer", "[prober]")
{
    SingleReplyServer server("HTTP/1.0 200 OK\r\nServer: Star Micronics WebServer\r\n\r\n");
    Identifier identifier(test_profiles());
    TcpProber prober(identifier, PROBE_NATIVE, short_timeouts());
    PrinterDevice device;

    REQUIRE(prober.checkAddress("127.0.0.1", http_port(server.port()), device));
    CHECK(device.address == make_network_address("127.0.0.1", server.port()));
    CHECK(device.name == "Star Micronics Receipt Printer (127.0.0.1)");
    CHECK(server.request().compare(0, 7, "HEAD / ") == 0);
}
