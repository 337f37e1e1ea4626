#include <cstdio>
#include <cstdint>
#include <spdlog/spdlog.h>

#include "core/TransferTask.hpp"

// FNV-1a 64-bit digest of the URL rendered as 16 hex digits
std::string makeTaskId(const std::string &url)
{
    std::uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : url)
    {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buffer);
}

TransferTask::TransferTask(const std::string &url, const std::string &destination)
    : _id(makeTaskId(url)), _url(url), _destination(destination)
{
}

void TransferTask::setTerminalCallback(TerminalCallback callback)
{
    std::lock_guard<std::mutex> lock(_stateMutex);
    _onTerminal = std::move(callback);
}

bool TransferTask::publish(const ProgressSnapshot &snapshot)
{
    TerminalCallback onTerminal;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);

        if (_hasPublished)
        {
            if (!isLegalTransition(_latest.status, snapshot.status))
            {
                spdlog::debug("Task {}: dropped {} snapshot after {}",
                              _id, statusName(snapshot.status), statusName(_latest.status));
                return false;
            }
        }
        else if (snapshot.status != TransferStatus::PENDING && !isTerminalStatus(snapshot.status))
        {
            return false;
        }

        _latest = snapshot;
        _hasPublished = true;

        if (isTerminalStatus(snapshot.status))
        {
            onTerminal = std::move(_onTerminal);
            _onTerminal = nullptr;
        }
    }

    // Release ownership before consumers can observe the terminal state
    if (onTerminal)
        onTerminal(*this);

    _channel.publish(snapshot);
    return true;
}

bool TransferTask::isFinished() const
{
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _hasPublished && isTerminalStatus(_latest.status);
}

ProgressSnapshot TransferTask::getLatestSnapshot() const
{
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _latest;
}
