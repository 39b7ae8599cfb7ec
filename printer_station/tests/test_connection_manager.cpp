#include <catch2/catch.hpp>
#include <chrono>
#include <thread>
#include "connection_manager.hpp"
#include "test_helpers.hpp"

namespace {

TransportCapabilities native_capabilities(bool bluetooth)
{
    TransportCapabilities capabilities;
    capabilities.supports_bluetooth = bluetooth;
    capabilities.probe_strategy = PROBE_NATIVE;
    return capabilities;
}

}

TEST_CASE("Connecting replaces the connected printer", "[connection]")
{
    LoopbackListener a;
    LoopbackListener b;
    ConnectionManager manager(native_capabilities(false), NULL, 500);

    REQUIRE(manager.connect(make_network_device("127.0.0.1", a.port(), "A")));
    REQUIRE(manager.connect(make_network_device("127.0.0.1", b.port(), "B")));

    PrinterDevice device;
    REQUIRE(manager.connectedPrinter(device));
    CHECK(device.name == "B");
    CHECK(device.connected);
    CHECK(manager.state() == STATE_CONNECTED);
}

TEST_CASE("Printing without a printer throws", "[connection]")
{
    ConnectionManager manager(native_capabilities(false));

    CHECK_THROWS_AS(manager.print("hello"), NoPrinterConnectedError);
}

TEST_CASE("Disconnect is idempotent", "[connection]")
{
    LoopbackListener listener;
    ConnectionManager manager(native_capabilities(false), NULL, 500);

    REQUIRE(manager.connect(make_network_device("127.0.0.1", listener.port(), "A")));

    manager.disconnect();
    CHECK(manager.state() == STATE_DISCONNECTED);
    manager.disconnect();
    CHECK(manager.state() == STATE_DISCONNECTED);

    PrinterDevice device;
    CHECK_FALSE(manager.connectedPrinter(device));
    CHECK_THROWS_AS(manager.print("hello"), NoPrinterConnectedError);
}

TEST_CASE("Receipt bytes reach a network printer", "[connection]")
{
    LoopbackListener listener;
    ConnectionManager manager(native_capabilities(false), NULL, 500);

    REQUIRE(manager.connect(make_network_device("127.0.0.1", listener.port(), "A")));
    REQUIRE(manager.print("NIGHTLY SALES REPORT\n"));

    CHECK(listener.drain() == "NIGHTLY SALES REPORT\n");
}

TEST_CASE("Failed connection leaves no printer connected", "[connection]")
{
    LoopbackListener listener;
    ConnectionManager manager(native_capabilities(false), NULL, 500);

    REQUIRE(manager.connect(make_network_device("127.0.0.1", listener.port(), "A")));
    CHECK_FALSE(manager.connect(make_network_device("127.0.0.1", unused_port(), "B")));

    CHECK(manager.state() == STATE_DISCONNECTED);
    PrinterDevice device;
    CHECK_FALSE(manager.connectedPrinter(device));
}

TEST_CASE("Print fails when the printer went away", "[connection]")
{
    LoopbackListener listener;
    ConnectionManager manager(native_capabilities(false), NULL, 500);

    REQUIRE(manager.connect(make_network_device("127.0.0.1", listener.port(), "A")));
    listener.close();

    CHECK_FALSE(manager.print("hello"));
    CHECK(manager.state() == STATE_CONNECTED);
}

TEST_CASE("Bluetooth printer without Bluetooth support", "[connection]")
{
    FakeBluetoothAdapter adapter;
    ConnectionManager manager(native_capabilities(false), &adapter);

    CHECK_THROWS_AS(manager.connect(make_bluetooth_device("00:11:22:33:44:55", "TSP100")),
                    UnsupportedTransportError);
    CHECK(adapter.opened.empty());
    CHECK(manager.state() == STATE_DISCONNECTED);
}

TEST_CASE("Bluetooth printer through the serial channel", "[connection]")
{
    FakeBluetoothAdapter adapter;
    ConnectionManager manager(native_capabilities(true), &adapter);

    REQUIRE(manager.connect(make_bluetooth_device("00:11:22:33:44:55", "TSP100")));
    CHECK(adapter.opened == "00:11:22:33:44:55");

    REQUIRE(manager.print("receipt"));
    CHECK(adapter.written == "receipt");

    SECTION("disconnect closes the channel") {
        manager.disconnect();
        CHECK(adapter.opened.empty());
    }

    SECTION("write failure") {
        adapter.write_ok = false;
        CHECK_FALSE(manager.print("more"));
        CHECK(adapter.written == "receipt");
    }

    SECTION("connecting elsewhere closes the channel") {
        LoopbackListener listener;
        REQUIRE(manager.connect(make_network_device("127.0.0.1", listener.port(), "A")));
        CHECK(adapter.opened.empty());
    }
}

TEST_CASE("Bluetooth channel that does not open", "[connection]")
{
    FakeBluetoothAdapter adapter;
    adapter.open_ok = false;
    ConnectionManager manager(native_capabilities(true), &adapter);

    CHECK_FALSE(manager.connect(make_bluetooth_device("00:11:22:33:44:55", "TSP100")));
    CHECK(manager.state() == STATE_DISCONNECTED);
}

TEST_CASE("Second connection attempt while connecting is refused", "[connection]")
{
    FakeBluetoothAdapter adapter;
    adapter.open_delay_ms = 300;
    ConnectionManager manager(native_capabilities(true), &adapter);
    LoopbackListener listener;

    bool connected = false;
    std::thread first([&manager, &connected] {
        connected = manager.connect(make_bluetooth_device("00:11:22:33:44:55", "A"));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    CHECK(manager.state() == STATE_CONNECTING);
    CHECK_FALSE(manager.connect(make_network_device("127.0.0.1", listener.port(), "B")));
    first.join();

    CHECK(connected);
    PrinterDevice device;
    REQUIRE(manager.connectedPrinter(device));
    CHECK(device.name == "A");
    CHECK(adapter.opened == "00:11:22:33:44:55");
}

TEST_CASE("Disconnect while connecting cancels the connection", "[connection]")
{
    FakeBluetoothAdapter adapter;
    adapter.open_delay_ms = 300;
    ConnectionManager manager(native_capabilities(true), &adapter);

    bool connected = true;
    std::thread connecting([&manager, &connected] {
        connected = manager.connect(make_bluetooth_device("00:11:22:33:44:55", "A"));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    manager.disconnect();
    PrinterDevice device;
    CHECK_FALSE(manager.connectedPrinter(device));
    connecting.join();

    CHECK_FALSE(connected);
    CHECK_FALSE(manager.connectedPrinter(device));
    CHECK(manager.state() == STATE_DISCONNECTED);
    CHECK(adapter.opened.empty());

    /* Next connection is not affected */
    adapter.open_delay_ms = 0;
    REQUIRE(manager.connect(make_bluetooth_device("00:11:22:33:44:55", "A")));
    CHECK(manager.state() == STATE_CONNECTED);
}

TEST_CASE("Preview printing publishes the receipt", "[connection]")
{
    TransportCapabilities capabilities;
    capabilities.preview_only = true;
    ConnectionManager manager(capabilities);

    std::vector<std::string> published;

    /* No transport is opened in preview mode */
    REQUIRE(manager.connect(make_network_device("192.0.2.1", 9100, "Preview")));

    CHECK_FALSE(manager.print("receipt"));

    manager.setPreviewPublisher([&published](const std::string &content) { published.push_back(content); });
    REQUIRE(manager.print("receipt"));
    REQUIRE(published.size() == 1);
    CHECK(published[0] == "receipt");
}

TEST_CASE("Connection state names", "[connection]")
{
    CHECK(connection_state_to_string(STATE_DISCONNECTED) == "disconnected");
    CHECK(connection_state_to_string(STATE_CONNECTING) == "connecting");
    CHECK(connection_state_to_string(STATE_CONNECTED) == "connected");
}
