#ifndef TRANSFERTASK_HPP
#define TRANSFERTASK_HPP

#include <string>
#include <atomic>
#include <mutex>
#include <functional>

#include "core/TransferTypes.hpp"
#include "core/ProgressChannel.hpp"

// Deterministic task id for a source URL, identical URLs always collide
std::string makeTaskId(const std::string &url);

class TransferTask
{
public:
    using TerminalCallback = std::function<void(const TransferTask &)>;

    TransferTask(const std::string &url, const std::string &destination);

    // Called once, before the terminal snapshot reaches any consumer
    void setTerminalCallback(TerminalCallback callback);

    // Records and broadcasts a snapshot. Snapshots that would move the
    // lifecycle backwards or leave a terminal state are dropped.
    bool publish(const ProgressSnapshot &snapshot);

    void cancel() { _cancelRequested.store(true); }
    bool isCancelled() const { return _cancelRequested.load(); }
    const std::atomic<bool> &cancelFlag() const { return _cancelRequested; }

    bool isFinished() const;

    ProgressStream subscribe() { return _channel.subscribe(); }
    ProgressSnapshot getLatestSnapshot() const;

    const std::string &getId() const { return _id; }
    const std::string &getUrl() const { return _url; }
    const std::string &getDestination() const { return _destination; }

private:
    std::string _id;
    std::string _url;
    std::string _destination;

    std::atomic<bool> _cancelRequested{false};

    mutable std::mutex _stateMutex;
    ProgressSnapshot _latest;
    bool _hasPublished{false};
    TerminalCallback _onTerminal;

    ProgressChannel _channel;
};

#endif
