#include <catch2/catch.hpp>
#include <set>
#include "printer_device.hpp"
#include "topology.hpp"

TEST_CASE("Subnet table is ordered and has no duplicates", "[topology]")
{
    const std::vector<std::string> &subnets = default_subnets();

    REQUIRE(!subnets.empty());
    CHECK(subnets[0] == "192.168.1");

    std::set<std::string> unique(subnets.begin(), subnets.end());
    CHECK(unique.size() == subnets.size());

    for (auto &prefix : subnets)
        CHECK(check_subnet_prefix(prefix));

    CHECK(unique.count("169.254.1"));
    CHECK(unique.count("10.0.0"));
    CHECK(unique.count("172.16.1"));
}

TEST_CASE("Subnet dedup keeps the first occurrence", "[topology]")
{
    std::vector<std::string> subnets = { "10.0.0", "192.168.1", "10.0.0", "172.16.1", "192.168.1" };
    std::vector<std::string> expected = { "10.0.0", "192.168.1", "172.16.1" };

    CHECK(dedup_subnets(subnets) == expected);
}

TEST_CASE("Port table starts with the most common printer ports", "[topology]")
{
    const std::vector<PortCandidate> &ports = default_ports();
    const uint16_t front[] = { 9100, 9101, 9102, 3001, 3002, 3003, 10001, 8001, 631, 515 };

    REQUIRE(ports.size() > 10);
    for (unsigned int i = 0; i < sizeof(front) / sizeof(front[0]); ++i)
        CHECK(ports[i].port == front[i]);

    std::set<uint16_t> unique;
    for (auto &p : ports)
        unique.insert(p.port);
    CHECK(unique.size() == ports.size());
}

TEST_CASE("Port protocols", "[topology]")
{
    PortCandidate candidate;

    REQUIRE(lookup_port(9100, candidate));
    CHECK(candidate.protocol == PORT_RAW);
    CHECK(std::string(candidate.label) == "ESC/POS Thermal Printer");

    REQUIRE(lookup_port(631, candidate));
    CHECK(candidate.protocol == PORT_HTTP);

    REQUIRE(lookup_port(80, candidate));
    CHECK(candidate.protocol == PORT_HTTP);

    REQUIRE(lookup_port(443, candidate));
    CHECK(candidate.protocol == PORT_TLS);

    REQUIRE(lookup_port(3001, candidate));
    CHECK(std::string(candidate.vendor) == "Star Micronics");

    CHECK_FALSE(lookup_port(12345, candidate));
}

TEST_CASE("Port list from numbers", "[topology]")
{
    std::vector<PortCandidate> ports = make_port_list({ 9100, 12345, 9100, 8080 });

    REQUIRE(ports.size() == 3);
    CHECK(ports[0].port == 9100);
    CHECK(ports[1].port == 12345);
    CHECK(ports[1].protocol == PORT_RAW);
    CHECK(ports[1].label == NULL);
    CHECK(ports[2].protocol == PORT_HTTP);
}

TEST_CASE("Host suffixes cover the whole range once", "[topology]")
{
    const std::vector<unsigned int> &suffixes = default_host_suffixes();

    REQUIRE(suffixes.size() == 254);
    CHECK(suffixes[0] == 200);
    CHECK(suffixes[10] == 100);

    std::set<unsigned int> unique(suffixes.begin(), suffixes.end());
    CHECK(unique.size() == 254);
    CHECK(*unique.begin() == 1);
    CHECK(*unique.rbegin() == 254);
}

TEST_CASE("Subnet prefix validation", "[topology]")
{
    CHECK(check_subnet_prefix("192.168.1"));
    CHECK(check_subnet_prefix("10.0.0"));
    CHECK_FALSE(check_subnet_prefix("192.168"));
    CHECK_FALSE(check_subnet_prefix("192.168.1.1"));
    CHECK_FALSE(check_subnet_prefix("192.168.256"));
    CHECK_FALSE(check_subnet_prefix("192.168.a"));
    CHECK_FALSE(check_subnet_prefix("192..1"));
    CHECK_FALSE(check_subnet_prefix(""));
}

TEST_CASE("Network and Bluetooth devices", "[device]")
{
    PrinterDevice net = make_network_device("192.168.1.105", 9100, "ESC/POS Thermal Printer (192.168.1.105)");
    CHECK(net.id == "ethernet-192.168.1.105-9100");
    CHECK(net.address == "192.168.1.105:9100");
    CHECK(net.transport == TRANSPORT_NETWORK);
    CHECK_FALSE(net.connected);
    CHECK(device_host(net) == "192.168.1.105");

    PrinterDevice bt = make_bluetooth_device("00:11:22:33:44:55", "TSP100");
    CHECK(bt.id == "bluetooth-00:11:22:33:44:55");
    CHECK(bt.transport == TRANSPORT_BLUETOOTH);
    CHECK(device_host(bt) == "00:11:22:33:44:55");
}

TEST_CASE("Address parsing", "[device]")
{
    std::string host;
    uint16_t port;

    REQUIRE(split_address("192.168.1.105:9100", host, port));
    CHECK(host == "192.168.1.105");
    CHECK(port == 9100);

    CHECK_FALSE(split_address("192.168.1.105", host, port));
    CHECK_FALSE(split_address("192.168.1.105:0", host, port));
    CHECK_FALSE(split_address("192.168.1.105:70000", host, port));
    CHECK_FALSE(split_address("192.168.1.105:91a0", host, port));
    CHECK_FALSE(split_address(":9100", host, port));

    CHECK(is_bluetooth_address("00:11:22:aa:BB:ff"));
    CHECK_FALSE(is_bluetooth_address("00:11:22:33:44"));
    CHECK_FALSE(is_bluetooth_address("00-11-22-33-44-55"));
    CHECK_FALSE(is_bluetooth_address("192.168.1.105:9100"));
}

TEST_CASE("Devices are deduplicated by host", "[device]")
{
    std::vector<PrinterDevice> devices = {
        make_network_device("192.168.1.105", 9100, "first"),
        make_network_device("192.168.1.105", 631, "second"),
        make_network_device("192.168.1.106", 9100, "third"),
        make_bluetooth_device("00:11:22:33:44:55", "fourth"),
        make_bluetooth_device("00:11:22:33:44:55", "fifth"),
    };

    dedup_by_host(devices);

    REQUIRE(devices.size() == 3);
    CHECK(devices[0].name == "first");
    CHECK(devices[1].name == "third");
    CHECK(devices[2].name == "fourth");
}
