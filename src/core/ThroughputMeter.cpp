#include "core/ThroughputMeter.hpp"

ThroughputMeter::ThroughputMeter(std::chrono::milliseconds emitInterval)
    : _emitInterval(emitInterval), _lastEmitTime(Clock::now())
{
}

void ThroughputMeter::reset(Clock::time_point now, std::uint64_t bytes)
{
    _lastEmitTime = now;
    _lastEmitBytes = bytes;
    _lastRate = 0.0;
}

bool ThroughputMeter::shouldEmit(Clock::time_point now, std::uint64_t bytes, std::uint64_t total) const
{
    if (total > 0 && bytes >= total && bytes != _lastEmitBytes)
        return true; // Final byte always gets a snapshot

    return now - _lastEmitTime >= _emitInterval;
}

double ThroughputMeter::recordEmission(Clock::time_point now, std::uint64_t bytes)
{
    double elapsed = std::chrono::duration<double>(now - _lastEmitTime).count();

    // Too short a window gives a meaningless rate, keep the previous one
    if (elapsed > 0.001 && bytes >= _lastEmitBytes)
    {
        _lastRate = static_cast<double>(bytes - _lastEmitBytes) / elapsed;
    }

    _lastEmitTime = now;
    _lastEmitBytes = bytes;
    return _lastRate;
}

std::optional<double> ThroughputMeter::estimateSecondsRemaining(std::uint64_t total,
                                                                std::uint64_t received,
                                                                double bytesPerSec)
{
    if (total == 0 || bytesPerSec <= 0.0)
        return std::nullopt;

    if (received >= total)
        return 0.0;

    return static_cast<double>(total - received) / bytesPerSec;
}
