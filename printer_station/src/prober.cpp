#include "prober.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <vector>

#define MAX_POLL_WAIT   (1000)      /* in milliseconds */

namespace {

void settle_slot(ProbeSlot &slot, short revents)
{
    try {
        slot.task->process(revents);
        slot.settled = slot.task->finished();
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Probe of " << slot.host << " abandoned: " << e.what();
        Logger::debug(ss.str());
        slot.settled = true;
        slot.task.reset();
    }
}

}

ProbeEvidence::ProbeEvidence():
strategy(PROBE_NONE),
vendor(-1),
vendor_confirmed(false),
endpoint(),
server()
{

}

bool Prober::checkAddress(const std::string &host, const PortCandidate &port, PrinterDevice &device)
{
    std::vector<ProbeSlot> slots(1);

    try {
        slots[0].host = host;
        slots[0].task = startProbe(host, std::vector<PortCandidate>(1, port));
        slots[0].settled = !slots[0].task || slots[0].task->finished();
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Failed to probe " << host << ':' << port.port << ": " << e.what();
        Logger::debug(ss.str());
        return false;
    }

    settle_probe_tasks(slots);

    if (!slots[0].task || !slots[0].task->found())
        return false;

    device = slots[0].task->device();
    return true;
}

void settle_probe_tasks(std::vector<ProbeSlot> &slots)
{
    std::vector<struct pollfd> fds;
    std::vector<size_t> owners;

    while (true) {
        fds.clear();
        owners.clear();

        auto now = std::chrono::steady_clock::now();
        auto next_deadline = now + std::chrono::milliseconds(MAX_POLL_WAIT);
        bool pending = false;

        for (size_t i = 0; i < slots.size(); ++i) {
            if (slots[i].settled)
                continue;

            pending = true;
            next_deadline = std::min(next_deadline, slots[i].task->deadline());

            int fd = slots[i].task->fd();
            if (fd < 0)
                continue;

            struct pollfd p;
            p.fd = fd;
            p.events = slots[i].task->events();
            p.revents = 0;
            fds.push_back(p);
            owners.push_back(i);
        }

        if (!pending)
            return;

        int timeout = 0;
        if (next_deadline > now)
            timeout = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(next_deadline - now).count()) + 1;

        int ret = poll(fds.empty() ? NULL : &fds[0], fds.size(), timeout);
        if (ret < 0) {
            if (errno == EINTR)
                continue;

            /* Nothing can be waited on anymore, give up on every probe */
            std::stringstream ss;
            ss << "Failed to poll probes: " << strerror(errno);
            Logger::err(ss.str());
            for (auto &slot : slots) {
                slot.settled = true;
                slot.task.reset();
            }
            return;
        }

        std::vector<bool> served(slots.size(), false);
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0)
                continue;

            served[owners[i]] = true;
            settle_slot(slots[owners[i]], fds[i].revents);
        }

        /* Expired deadlines */
        now = std::chrono::steady_clock::now();
        for (size_t i = 0; i < slots.size(); ++i) {
            if (slots[i].settled || served[i])
                continue;

            if (slots[i].task->deadline() <= now)
                settle_slot(slots[i], 0);
        }
    }
}
