#include "batch_scheduler.hpp"
#include "logger.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

#define MAX_HOST_SUFFIX     (254)

namespace {

std::vector<unsigned int> filter_suffixes(const std::vector<unsigned int> &suffixes)
{
    std::vector<unsigned int> valid;
    std::set<unsigned int> seen;

    for (auto suffix : suffixes) {
        if (suffix < 1 || suffix > MAX_HOST_SUFFIX)
            continue;
        if (seen.insert(suffix).second)
            valid.push_back(suffix);
    }

    return valid;
}

}

BatchStats::BatchStats():
waves(0),
probes(0),
peak_outstanding(0)
{

}

BatchScheduler::BatchScheduler(Prober &prober, unsigned int batch_size, unsigned int batch_delay_ms):
m_prober(prober),
m_batch_size(batch_size > 0 ? batch_size : 1),
m_batch_delay(batch_delay_ms),
m_timer(),
m_stats_mutex(),
m_stats()
{

}

std::vector<PrinterDevice> BatchScheduler::scan(const std::string &prefix,
                                                const std::vector<unsigned int> &suffixes,
                                                const std::vector<PortCandidate> &ports)
{
    std::vector<PrinterDevice> devices;
    std::vector<unsigned int> hosts = filter_suffixes(suffixes);

    if (hosts.empty() || ports.empty())
        return devices;

    {
        std::stringstream ss;
        ss << "Scanning " << prefix << ".x: " << hosts.size() << " hosts, "
           << ports.size() << " ports";
        Logger::debug(ss.str());
    }

    for (size_t begin = 0; begin < hosts.size(); begin += m_batch_size) {
        size_t end = std::min(hosts.size(), begin + m_batch_size);

        runBatch(prefix, hosts, begin, end, ports, devices);

        if (end < hosts.size())
            pace();
    }

    dedup_by_host(devices);
    return devices;
}

std::vector<PrinterDevice> BatchScheduler::sweep(const std::vector<std::string> &prefixes,
                                                 const std::vector<unsigned int> &suffixes,
                                                 const std::vector<PortCandidate> &ports)
{
    std::vector<PrinterDevice> devices;

    for (auto &prefix : prefixes) {
        if (!check_subnet_prefix(prefix)) {
            std::stringstream ss;
            ss << "Skipping invalid subnet prefix \"" << prefix << '"';
            Logger::warn(ss.str());
            continue;
        }

        std::vector<PrinterDevice> found = scan(prefix, suffixes, ports);
        devices.insert(devices.end(), found.begin(), found.end());
    }

    dedup_by_host(devices);
    return devices;
}

void BatchScheduler::runBatch(const std::string &prefix,
                              const std::vector<unsigned int> &suffixes,
                              size_t begin, size_t end,
                              const std::vector<PortCandidate> &ports,
                              std::vector<PrinterDevice> &devices)
{
    std::vector<ProbeSlot> slots(end - begin);
    unsigned int outstanding = 0;

    for (size_t i = begin; i < end; ++i) {
        ProbeSlot &slot = slots[i - begin];

        std::stringstream host;
        host << prefix << '.' << suffixes[i];
        slot.host = host.str();

        try {
            slot.task = m_prober.startProbe(slot.host, ports);
        } catch (const std::exception &e) {
            std::stringstream ss;
            ss << "Failed to start probe of " << slot.host << ": " << e.what();
            Logger::debug(ss.str());
        }

        slot.settled = !slot.task || slot.task->finished();
        if (!slot.settled)
            outstanding++;
    }

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.probes += static_cast<unsigned int>(slots.size());
        m_stats.waves++;
        if (outstanding > m_stats.peak_outstanding)
            m_stats.peak_outstanding = outstanding;
    }

    settle_probe_tasks(slots);

    for (auto &slot : slots) {
        if (slot.task && slot.task->finished() && slot.task->found())
            devices.push_back(slot.task->device());
    }
}

void BatchScheduler::pace()
{
    if (m_batch_delay == 0)
        return;

    try {
        m_timer.start(m_batch_delay);
        if (!m_timer.wait())
            Logger::warn("Batch pacing timer failed");
    } catch (const std::runtime_error &e) {
        std::stringstream ss;
        ss << "Batch pacing disabled: " << e.what();
        Logger::warn(ss.str());
    }
}

BatchStats BatchScheduler::stats() const
{
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

void BatchScheduler::resetStats()
{
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats = BatchStats();
}

unsigned int BatchScheduler::batchSize() const
{
    return m_batch_size;
}

unsigned int BatchScheduler::batchDelay() const
{
    return m_batch_delay;
}
