#ifndef DEVICE_CACHE_HPP
#define DEVICE_CACHE_HPP

#include "printer_device.hpp"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

#define DEFAULT_CACHE_TTL   (30)    /* in seconds */

/*
 * Last sweep result, served again while it is younger than the TTL and
 * not empty. Callers arriving during a sweep wait for it instead of
 * starting another one.
 */
class DeviceCache {
public:
    typedef std::function<std::vector<PrinterDevice>()> SweepFunction;

    explicit DeviceCache(unsigned int ttl_s = DEFAULT_CACHE_TTL);

    /**
     * @brief Cached devices, or the result of a new sweep.
     *
     * Exceptions thrown by sweep are rethrown to the caller that ran it,
     * callers waiting on that sweep get an empty list.
     */
    std::vector<PrinterDevice> get(const SweepFunction &sweep);

    void clear();

    /* Copy of the cache, false if it was never filled or got cleared */
    bool peek(ScanResult &result) const;

    unsigned int sweepCount() const;
    unsigned int ttl() const;

private:
    bool fresh() const;

    mutable std::mutex m_mutex;
    std::condition_variable m_done;
    ScanResult m_result;
    bool m_valid;
    bool m_sweeping;
    bool m_last_failed;
    unsigned long m_generation;
    unsigned int m_sweeps;
    unsigned int m_ttl;
};

#endif
