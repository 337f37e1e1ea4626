#ifndef TRANSFERHANDLE_HPP
#define TRANSFERHANDLE_HPP

#include <memory>
#include <chrono>
#include <string>

#include "core/TransferTask.hpp"
#include "core/ProgressChannel.hpp"

// What a caller of TaskSupervisor::start() holds: the snapshot sequence of
// one transfer plus the control to cancel it
class TransferHandle
{
public:
    TransferHandle(std::shared_ptr<TransferTask> task, bool joinedExisting);

    bool next(ProgressSnapshot &snapshot);
    bool next(ProgressSnapshot &snapshot, std::chrono::milliseconds timeout);

    // Consumes the rest of the sequence and returns its terminal snapshot
    ProgressSnapshot waitForCompletion();

    void cancel();

    bool isJoinedExisting() const { return _joinedExisting; }
    const std::string &getUrl() const { return _task->getUrl(); }
    const std::string &getDestination() const { return _task->getDestination(); }
    const std::string &getTaskId() const { return _task->getId(); }

private:
    std::shared_ptr<TransferTask> _task;
    ProgressStream _stream;
    bool _joinedExisting;
};

#endif
