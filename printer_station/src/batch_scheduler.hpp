#ifndef BATCH_SCHEDULER_HPP
#define BATCH_SCHEDULER_HPP

#include "printer_device.hpp"
#include "prober.hpp"
#include "timer.hpp"
#include "topology.hpp"
#include <mutex>
#include <string>
#include <vector>

#define DEFAULT_BATCH_SIZE      (20)
#define DEFAULT_BATCH_DELAY     (100)   /* in milliseconds */

struct BatchStats {
    BatchStats();

    unsigned int waves;             /* batches run */
    unsigned int probes;            /* probe tasks started */
    unsigned int peak_outstanding;  /* most probes pending at once */
};

/*
 * Sweeps subnets batch after batch. All probes of a batch run at once,
 * multiplexed in the calling thread, and the next batch starts once the
 * whole batch settled and the pacing delay elapsed.
 */
class BatchScheduler {
public:
    BatchScheduler(Prober &prober,
                   unsigned int batch_size = DEFAULT_BATCH_SIZE,
                   unsigned int batch_delay_ms = DEFAULT_BATCH_DELAY);

    /**
     * @brief Probe prefix.suffix for every suffix in 1..254.
     *
     * @return devices found, in suffix order, one per host
     */
    std::vector<PrinterDevice> scan(const std::string &prefix,
                                    const std::vector<unsigned int> &suffixes,
                                    const std::vector<PortCandidate> &ports);

    /* Scan every prefix in order */
    std::vector<PrinterDevice> sweep(const std::vector<std::string> &prefixes,
                                     const std::vector<unsigned int> &suffixes,
                                     const std::vector<PortCandidate> &ports);

    /* Safe to call from other threads while a sweep runs */
    BatchStats stats() const;
    void resetStats();

    unsigned int batchSize() const;
    unsigned int batchDelay() const;

private:
    void runBatch(const std::string &prefix,
                  const std::vector<unsigned int> &suffixes,
                  size_t begin, size_t end,
                  const std::vector<PortCandidate> &ports,
                  std::vector<PrinterDevice> &devices);
    void pace();

    Prober &m_prober;
    unsigned int m_batch_size;
    unsigned int m_batch_delay;
    Timer m_timer;

    mutable std::mutex m_stats_mutex;
    BatchStats m_stats;
};

#endif
