#include "device_cache.hpp"
#include "logger.hpp"
#include <chrono>
#include <sstream>

DeviceCache::DeviceCache(unsigned int ttl_s):
m_mutex(),
m_done(),
m_result(),
m_valid(false),
m_sweeping(false),
m_last_failed(false),
m_generation(0),
m_sweeps(0),
m_ttl(ttl_s)
{

}

std::vector<PrinterDevice> DeviceCache::get(const SweepFunction &sweep)
{
    std::unique_lock<std::mutex> lock(m_mutex);

    if (fresh()) {
        Logger::debug("Returning cached printers");
        return m_result.devices;
    }

    if (m_sweeping) {
        Logger::debug("Waiting for the sweep in progress");
        unsigned long generation = m_generation;
        m_done.wait(lock, [this, generation] { return m_generation != generation; });
        if (m_last_failed)
            return std::vector<PrinterDevice>();
        return m_result.devices;
    }

    m_sweeping = true;
    m_sweeps++;
    lock.unlock();

    std::vector<PrinterDevice> devices;
    try {
        devices = sweep();
    } catch (...) {
        lock.lock();
        m_sweeping = false;
        m_last_failed = true;
        m_generation++;
        m_done.notify_all();
        throw;
    }

    dedup_by_host(devices);

    lock.lock();
    m_result.devices = devices;
    m_result.timestamp = std::chrono::steady_clock::now();
    m_valid = true;
    m_sweeping = false;
    m_last_failed = false;
    m_generation++;
    m_done.notify_all();

    std::stringstream ss;
    ss << "Sweep found " << devices.size() << " printer(s)";
    Logger::info(ss.str());

    return devices;
}

void DeviceCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_valid = false;
    m_result = ScanResult();
}

bool DeviceCache::peek(ScanResult &result) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_valid)
        return false;

    result = m_result;
    return true;
}

unsigned int DeviceCache::sweepCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sweeps;
}

unsigned int DeviceCache::ttl() const
{
    return m_ttl;
}

/* Called with m_mutex held */
bool DeviceCache::fresh() const
{
    if (!m_valid || m_result.devices.empty())
        return false;

    auto age = std::chrono::steady_clock::now() - m_result.timestamp;
    return age < std::chrono::seconds(m_ttl);
}
