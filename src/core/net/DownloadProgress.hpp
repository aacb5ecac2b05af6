#pragma once

#include <QtGlobal>
#include <atomic>

namespace pem {

/// Live transfer counters shared between the worker writing a file and any
/// number of readers polling for display. Reads never block.
class DownloadProgress {
public:
    struct Snapshot {
        quint64 received = 0;
        quint64 total = 0;      // 0 when the server sent no Content-Length
        double speedMiBps = 0.0;
    };

    void reset(quint64 total)
    {
        received_.store(0, std::memory_order_relaxed);
        speed_.store(0.0, std::memory_order_relaxed);
        total_.store(total, std::memory_order_release);
    }

    void update(quint64 received, double speedMiBps)
    {
        speed_.store(speedMiBps, std::memory_order_relaxed);
        received_.store(received, std::memory_order_release);
    }

    Snapshot snapshot() const
    {
        Snapshot s;
        s.received = received_.load(std::memory_order_acquire);
        s.total = total_.load(std::memory_order_acquire);
        s.speedMiBps = speed_.load(std::memory_order_relaxed);
        return s;
    }

private:
    std::atomic<quint64> received_{0};
    std::atomic<quint64> total_{0};
    std::atomic<double> speed_{0.0};
};

} // namespace pem
