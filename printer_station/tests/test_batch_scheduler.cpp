#include <catch2/catch.hpp>
#include <chrono>
#include "batch_scheduler.hpp"
#include "test_helpers.hpp"

TEST_CASE("Only the answering host is found", "[scheduler]")
{
    FakeProber prober;
    prober.answer("192.168.1.105:9100");

    BatchScheduler scheduler(prober, 20, 0);
    std::vector<PrinterDevice> devices = scheduler.scan("192.168.1", default_host_suffixes(),
                                                        make_port_list({ 9100, 9101 }));

    REQUIRE(devices.size() == 1);
    CHECK(devices[0].address == "192.168.1.105:9100");
    CHECK(devices[0].transport == TRANSPORT_NETWORK);
    CHECK(devices[0].id == "ethernet-192.168.1.105-9100");
}

TEST_CASE("254 hosts in batches of 20 run 13 waves", "[scheduler]")
{
    FakeProber prober;
    BatchScheduler scheduler(prober, 20, 0);

    scheduler.scan("192.168.1", default_host_suffixes(), default_ports());

    BatchStats stats = scheduler.stats();
    CHECK(stats.waves == 13);
    CHECK(stats.probes == 254);
    CHECK(stats.peak_outstanding <= 20);
    CHECK(prober.probeCount() == 254);
    CHECK(prober.peakOutstanding() <= 20);
    CHECK(prober.peakOutstanding() > 1);
}

TEST_CASE("Batch size bounds concurrency", "[scheduler]")
{
    FakeProber prober;
    prober.delay_ms = 5;
    BatchScheduler scheduler(prober, 7, 0);

    scheduler.scan("10.0.0", default_host_suffixes(), make_port_list({ 9100 }));

    CHECK(scheduler.stats().waves == 37);
    CHECK(scheduler.stats().peak_outstanding == 7);
    CHECK(prober.peakOutstanding() == 7);
}

TEST_CASE("Zero batch size probes one host at a time", "[scheduler]")
{
    FakeProber prober;
    BatchScheduler scheduler(prober, 0, 0);

    CHECK(scheduler.batchSize() == 1);
    scheduler.scan("10.0.0", { 1, 2, 3 }, make_port_list({ 9100 }));
    CHECK(scheduler.stats().waves == 3);
    CHECK(prober.peakOutstanding() == 1);
}

TEST_CASE("Invalid and repeated suffixes are skipped", "[scheduler]")
{
    FakeProber prober;
    BatchScheduler scheduler(prober, 20, 0);

    scheduler.scan("10.0.0", { 0, 5, 5, 255, 300, 7 }, make_port_list({ 9100 }));

    CHECK(prober.probeCount() == 2);
    CHECK(scheduler.stats().waves == 1);
}

TEST_CASE("Batches are paced", "[scheduler]")
{
    FakeProber prober;
    BatchScheduler scheduler(prober, 2, 50);

    auto start = std::chrono::steady_clock::now();
    scheduler.scan("10.0.0", { 1, 2, 3, 4, 5 }, make_port_list({ 9100 }));
    auto elapsed = std::chrono::steady_clock::now() - start;

    /* Three batches, two pauses */
    CHECK(scheduler.stats().waves == 3);
    CHECK(elapsed >= std::chrono::milliseconds(100));
}

TEST_CASE("Sweep covers every prefix in order", "[scheduler]")
{
    FakeProber prober;
    prober.answer("10.0.0.1:9100");
    prober.answer("192.168.1.200:9100");

    BatchScheduler scheduler(prober, 20, 0);
    std::vector<PrinterDevice> devices = scheduler.sweep({ "192.168.1", "bogus", "10.0.0" },
                                                         default_host_suffixes(),
                                                         make_port_list({ 9100 }));

    REQUIRE(devices.size() == 2);
    CHECK(devices[0].address == "192.168.1.200:9100");
    CHECK(devices[1].address == "10.0.0.1:9100");
    CHECK(scheduler.stats().waves == 26);
}

TEST_CASE("Probe failures never escape a scan", "[scheduler]")
{
    FakeProber prober;
    prober.answer("10.0.0.1:9100");
    BatchScheduler scheduler(prober, 20, 0);

    SECTION("starting a probe throws") {
        prober.throw_on_start = true;
        std::vector<PrinterDevice> devices;
        REQUIRE_NOTHROW(devices = scheduler.scan("10.0.0", default_host_suffixes(), make_port_list({ 9100 })));
        CHECK(devices.empty());
        CHECK(prober.probeCount() == 254);
    }

    SECTION("running a probe throws") {
        prober.throw_on_process = true;
        std::vector<PrinterDevice> devices;
        REQUIRE_NOTHROW(devices = scheduler.scan("10.0.0", default_host_suffixes(), make_port_list({ 9100 })));
        CHECK(devices.empty());
    }
}

TEST_CASE("Statistics reset", "[scheduler]")
{
    FakeProber prober;
    BatchScheduler scheduler(prober, 20, 0);

    scheduler.scan("10.0.0", { 1, 2 }, make_port_list({ 9100 }));
    REQUIRE(scheduler.stats().waves == 1);

    scheduler.resetStats();
    CHECK(scheduler.stats().waves == 0);
    CHECK(scheduler.stats().probes == 0);
    CHECK(scheduler.stats().peak_outstanding == 0);
}
