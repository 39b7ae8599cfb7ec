#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "device_cache.hpp"

namespace {

std::vector<PrinterDevice> one_printer()
{
    return std::vector<PrinterDevice>(1, make_network_device("192.168.1.105", 9100, "printer"));
}

}

TEST_CASE("Recent sweep is served from cache", "[cache]")
{
    DeviceCache cache(30);
    unsigned int sweeps = 0;
    auto sweep = [&sweeps] { sweeps++; return one_printer(); };

    std::vector<PrinterDevice> first = cache.get(sweep);
    std::vector<PrinterDevice> second = cache.get(sweep);

    CHECK(sweeps == 1);
    CHECK(cache.sweepCount() == 1);
    REQUIRE(second.size() == 1);
    CHECK(second[0].address == first[0].address);

    ScanResult result;
    REQUIRE(cache.peek(result));
    CHECK(result.devices.size() == 1);
}

TEST_CASE("Empty sweep is not cached", "[cache]")
{
    DeviceCache cache(30);
    unsigned int sweeps = 0;
    auto sweep = [&sweeps] { sweeps++; return std::vector<PrinterDevice>(); };

    cache.get(sweep);
    cache.get(sweep);

    CHECK(sweeps == 2);
}

TEST_CASE("Expired cache sweeps again", "[cache]")
{
    DeviceCache cache(0);
    unsigned int sweeps = 0;
    auto sweep = [&sweeps] { sweeps++; return one_printer(); };

    cache.get(sweep);
    cache.get(sweep);

    CHECK(sweeps == 2);
}

TEST_CASE("Cleared cache sweeps again", "[cache]")
{
    DeviceCache cache(30);
    unsigned int sweeps = 0;
    auto sweep = [&sweeps] { sweeps++; return one_printer(); };

    cache.get(sweep);
    cache.clear();

    ScanResult result;
    CHECK_FALSE(cache.peek(result));

    cache.get(sweep);
    CHECK(sweeps == 2);
}

TEST_CASE("Sweep results are deduplicated by host", "[cache]")
{
    DeviceCache cache(30);
    auto sweep = [] {
        std::vector<PrinterDevice> devices;
        devices.push_back(make_network_device("192.168.1.105", 9100, "first"));
        devices.push_back(make_network_device("192.168.1.105", 80, "second"));
        return devices;
    };

    std::vector<PrinterDevice> devices = cache.get(sweep);

    REQUIRE(devices.size() == 1);
    CHECK(devices[0].name == "first");
}

TEST_CASE("Failed sweep is reported and not cached", "[cache]")
{
    DeviceCache cache(30);
    unsigned int sweeps = 0;

    CHECK_THROWS_AS(cache.get([&sweeps]() -> std::vector<PrinterDevice> {
        sweeps++;
        throw std::runtime_error("sweep failed");
    }), std::runtime_error);

    std::vector<PrinterDevice> devices = cache.get([&sweeps] { sweeps++; return one_printer(); });
    CHECK(devices.size() == 1);
    CHECK(sweeps == 2);
}

TEST_CASE("Concurrent callers share one sweep", "[cache]")
{
    DeviceCache cache(30);
    std::atomic<unsigned int> sweeps(0);
    auto sweep = [&sweeps] {
        sweeps++;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return one_printer();
    };

    std::vector<std::vector<PrinterDevice>> results(4);
    std::vector<std::thread> threads;
    for (unsigned int i = 0; i < results.size(); ++i)
        threads.push_back(std::thread([&cache, &sweep, &results, i] { results[i] = cache.get(sweep); }));
    for (auto &t : threads)
        t.join();

    CHECK(sweeps.load() == 1);
    for (auto &r : results) {
        REQUIRE(r.size() == 1);
        CHECK(r[0].address == "192.168.1.105:9100");
    }
}
