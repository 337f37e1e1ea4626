#include "core/TransferHandle.hpp"

TransferHandle::TransferHandle(std::shared_ptr<TransferTask> task, bool joinedExisting)
    : _task(std::move(task)), _stream(_task->subscribe()), _joinedExisting(joinedExisting)
{
}

bool TransferHandle::next(ProgressSnapshot &snapshot)
{
    return _stream.next(snapshot);
}

bool TransferHandle::next(ProgressSnapshot &snapshot, std::chrono::milliseconds timeout)
{
    return _stream.next(snapshot, timeout);
}

ProgressSnapshot TransferHandle::waitForCompletion()
{
    ProgressSnapshot snapshot;
    ProgressSnapshot last = _task->getLatestSnapshot();
    while (_stream.next(snapshot))
    {
        last = snapshot;
    }
    return last;
}

void TransferHandle::cancel()
{
    _task->cancel();
}
