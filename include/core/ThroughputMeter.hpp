#ifndef THROUGHPUTMETER_HPP
#define THROUGHPUTMETER_HPP

#include <chrono>
#include <cstdint>
#include <optional>

// Rate bookkeeping between emitted progress snapshots. The rate reported
// for an emission covers only the bytes received since the previous one.
class ThroughputMeter
{
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputMeter(std::chrono::milliseconds emitInterval);

    void reset(Clock::time_point now, std::uint64_t bytes);

    // True when the throttle interval has elapsed or the last byte has arrived
    bool shouldEmit(Clock::time_point now, std::uint64_t bytes, std::uint64_t total) const;

    // Closes the current measurement window and returns its rate in bytes/sec
    double recordEmission(Clock::time_point now, std::uint64_t bytes);

    double getLastRate() const { return _lastRate; }

    static std::optional<double> estimateSecondsRemaining(std::uint64_t total,
                                                          std::uint64_t received,
                                                          double bytesPerSec);

private:
    std::chrono::milliseconds _emitInterval;
    Clock::time_point _lastEmitTime;
    std::uint64_t _lastEmitBytes{0};
    double _lastRate{0.0};
};

#endif
