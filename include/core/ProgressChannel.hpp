#ifndef PROGRESSCHANNEL_HPP
#define PROGRESSCHANNEL_HPP

#include <memory>
#include <deque>
#include <vector>
#include <mutex>
#include <chrono>
#include <optional>
#include <condition_variable>

#include "core/TransferTypes.hpp"

class ProgressStream;

// Broadcasts the snapshots of one transfer to any number of consumers.
// A consumer that subscribes late starts from the most recent snapshot,
// earlier history is not replayed. The channel closes itself after the
// first terminal snapshot.
class ProgressChannel
{
public:
    ProgressChannel();

    void publish(const ProgressSnapshot &snapshot);
    ProgressStream subscribe();

    bool isClosed() const;
    std::optional<ProgressSnapshot> latest() const;

private:
    struct State
    {
        mutable std::mutex mutex;
        std::condition_variable condition;
        std::vector<std::shared_ptr<std::deque<ProgressSnapshot>>> queues;
        std::optional<ProgressSnapshot> latest;
        bool closed{false};
    };

    std::shared_ptr<State> _state;

    friend class ProgressStream;
};

// Pull side of a ProgressChannel, owned by a single consumer
class ProgressStream
{
public:
    ProgressStream() = default;

    // Blocks until a snapshot is available; false once the sequence has ended
    bool next(ProgressSnapshot &snapshot);
    bool next(ProgressSnapshot &snapshot, std::chrono::milliseconds timeout);

    bool isValid() const { return _state != nullptr; }

private:
    ProgressStream(std::shared_ptr<ProgressChannel::State> state,
                   std::shared_ptr<std::deque<ProgressSnapshot>> queue);

    bool popLocked(ProgressSnapshot &snapshot);

    std::shared_ptr<ProgressChannel::State> _state;
    std::shared_ptr<std::deque<ProgressSnapshot>> _queue;

    friend class ProgressChannel;
};

#endif
