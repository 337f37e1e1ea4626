#include <spdlog/spdlog.h>

#include "core/TaskSupervisor.hpp"
#include "util/file.hpp"

TaskSupervisor::TaskSupervisor(size_t maxConcurrent, const TransferSettings &settings)
    : _maxConcurrent(maxConcurrent == 0 ? SSM_DEFAULT_MAX_CONCURRENT : maxConcurrent),
      _engine(settings),
      _threadPool(_maxConcurrent)
{
}

TaskSupervisor::~TaskSupervisor()
{
    shutdown();
}

// Admits a transfer, joins an identical one in flight, or rejects it when the ceiling is reached
Result<TransferHandle> TaskSupervisor::start(const std::string &url, const TransferOptions &options)
{
    if (url.empty())
        return Error{ErrorKind::PROTOCOL, "empty URL"};
    if (options.destinationPath.empty())
        return Error{ErrorKind::IO, "no destination for " + url};

    std::string id = makeTaskId(url);

    std::lock_guard<std::mutex> lock(_mutex);

    if (_shuttingDown)
        return Error{ErrorKind::CONCURRENCY_LIMIT, "transfers are shutting down"};

    auto it = _live.find(id);
    if (it != _live.end())
    {
        spdlog::debug("Joining transfer already in flight for {}", url);
        return TransferHandle(it->second, true);
    }

    if (_live.size() >= _maxConcurrent)
    {
        spdlog::warn("Rejected {}: {} transfers already active", url, _live.size());
        return Error{ErrorKind::CONCURRENCY_LIMIT,
                     "Maximum concurrent downloads (" + std::to_string(_maxConcurrent) + ") reached"};
    }

    for (const auto &entry : _live)
    {
        if (entry.second->getDestination() == options.destinationPath)
            return Error{ErrorKind::IO, "destination " + options.destinationPath + " is in use by " + entry.second->getUrl()};
    }

    auto task = std::make_shared<TransferTask>(url, options.destinationPath);
    task->setTerminalCallback([this](const TransferTask &finished)
                              { release(finished); });

    TransferRequest request;
    request.resumeFromByte = options.resume ? fileSize(options.destinationPath) : 0;
    request.extract = options.extract;
    request.extractTo = options.extractTo;
    request.onExtracted = options.onExtracted;

    // Subscribe before the worker can publish, so PENDING is not missed
    TransferHandle handle(task, false);

    _live[id] = task;
    if (!_threadPool.enqueue([this, task, request]()
                             { runTask(task, request); }))
    {
        _live.erase(id);
        return Error{ErrorKind::CONCURRENCY_LIMIT, "transfers are shutting down"};
    }

    spdlog::info("Started transfer {} -> {}", url, options.destinationPath);
    return handle;
}

bool TaskSupervisor::cancel(const std::string &url)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _live.find(makeTaskId(url));
    if (it == _live.end())
        return false;

    it->second->cancel();
    spdlog::info("Cancel requested for {}", url);
    return true;
}

void TaskSupervisor::cancelAll()
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto &entry : _live)
    {
        entry.second->cancel();
    }
}

void TaskSupervisor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _shuttingDown = true;
    }
    cancelAll();
    _threadPool.shutdown();
}

bool TaskSupervisor::isActive(const std::string &url) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _live.count(makeTaskId(url)) > 0;
}

std::vector<std::string> TaskSupervisor::activeUrls() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> urls;
    urls.reserve(_live.size());
    for (const auto &entry : _live)
    {
        urls.push_back(entry.second->getUrl());
    }
    return urls;
}

std::optional<ProgressSnapshot> TaskSupervisor::latestSnapshot(const std::string &url) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _live.find(makeTaskId(url));
    if (it == _live.end())
        return std::nullopt;
    return it->second->getLatestSnapshot();
}

size_t TaskSupervisor::activeCount() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _live.size();
}

//------------------------------------------------------------------------------
// Worker side
//------------------------------------------------------------------------------

void TaskSupervisor::runTask(std::shared_ptr<TransferTask> task, const TransferRequest &request)
{
    _engine.transfer(*task, request);

    // The engine always ends the sequence; this only guards against a broken invariant
    if (!task->isFinished())
    {
        ProgressSnapshot latest = task->getLatestSnapshot();
        task->publish(makeFailedSnapshot(Error{ErrorKind::IO, "transfer ended without a final status"},
                                         latest.bytesReceived, latest.bytesTotal));
    }
}

// Single exit point: runs from the task's terminal transition, exactly once per task
void TaskSupervisor::release(const TransferTask &task)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _live.find(task.getId());
    if (it != _live.end() && it->second.get() == &task)
    {
        _live.erase(it);
        spdlog::debug("Released transfer slot for {} ({} active)", task.getUrl(), _live.size());
    }
}
