#include "core/ProgressChannel.hpp"

ProgressChannel::ProgressChannel() : _state(std::make_shared<State>()) {}

// Appends the snapshot to every subscriber queue and wakes waiting consumers
void ProgressChannel::publish(const ProgressSnapshot &snapshot)
{
    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->closed)
            return;

        _state->latest = snapshot;
        for (auto &queue : _state->queues)
        {
            queue->push_back(snapshot);
        }

        if (isTerminalStatus(snapshot.status))
            _state->closed = true;
    }
    _state->condition.notify_all();
}

// Registers a new consumer, seeded with the latest snapshot if there is one
ProgressStream ProgressChannel::subscribe()
{
    auto queue = std::make_shared<std::deque<ProgressSnapshot>>();

    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->latest)
    {
        queue->push_back(*_state->latest);
    }
    if (!_state->closed)
    {
        _state->queues.push_back(queue);
    }
    return ProgressStream(_state, queue);
}

bool ProgressChannel::isClosed() const
{
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->closed;
}

std::optional<ProgressSnapshot> ProgressChannel::latest() const
{
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->latest;
}

//------------------------------------------------------------------------------
// ProgressStream
//------------------------------------------------------------------------------

ProgressStream::ProgressStream(std::shared_ptr<ProgressChannel::State> state,
                               std::shared_ptr<std::deque<ProgressSnapshot>> queue)
    : _state(std::move(state)), _queue(std::move(queue))
{
}

bool ProgressStream::popLocked(ProgressSnapshot &snapshot)
{
    if (_queue->empty())
        return false;

    snapshot = _queue->front();
    _queue->pop_front();
    return true;
}

bool ProgressStream::next(ProgressSnapshot &snapshot)
{
    if (!_state)
        return false;

    std::unique_lock<std::mutex> lock(_state->mutex);
    _state->condition.wait(lock, [this]
                           { return !_queue->empty() || _state->closed; });
    return popLocked(snapshot);
}

bool ProgressStream::next(ProgressSnapshot &snapshot, std::chrono::milliseconds timeout)
{
    if (!_state)
        return false;

    std::unique_lock<std::mutex> lock(_state->mutex);
    _state->condition.wait_for(lock, timeout, [this]
                               { return !_queue->empty() || _state->closed; });
    return popLocked(snapshot);
}
