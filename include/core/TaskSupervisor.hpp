#ifndef TASKSUPERVISOR_HPP
#define TASKSUPERVISOR_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

#include "core/Error.hpp"
#include "core/TransferTask.hpp"
#include "core/TransferHandle.hpp"
#include "core/TransferEngine.hpp"
#include "aux/ThreadPool.hpp"

static constexpr size_t SSM_DEFAULT_MAX_CONCURRENT = 3;

struct TransferOptions
{
    std::string destinationPath;
    bool resume{true}; // Continue from an existing partial file
    bool extract{false};
    std::string extractTo;
    std::function<Status(const std::string &directory)> onExtracted;
};

// Owns every in-flight transfer, keyed by the id derived from its URL.
// Admission is refused outright once the ceiling is reached; a request
// for a URL that is already in flight joins the running transfer.
class TaskSupervisor
{
public:
    TaskSupervisor(size_t maxConcurrent, const TransferSettings &settings);
    ~TaskSupervisor();

    TaskSupervisor(const TaskSupervisor &) = delete;
    TaskSupervisor &operator=(const TaskSupervisor &) = delete;

    Result<TransferHandle> start(const std::string &url, const TransferOptions &options);

    bool cancel(const std::string &url);
    void cancelAll();

    // Cancels everything, stops admitting and waits for the workers
    void shutdown();

    bool isActive(const std::string &url) const;
    std::vector<std::string> activeUrls() const;
    std::optional<ProgressSnapshot> latestSnapshot(const std::string &url) const;
    size_t activeCount() const;
    size_t getMaxConcurrent() const { return _maxConcurrent; }

private:
    size_t _maxConcurrent;
    TransferEngine _engine;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<TransferTask>> _live;
    bool _shuttingDown{false};

    // Declared last so workers are joined before the members they use go away
    ThreadPool _threadPool;

    void runTask(std::shared_ptr<TransferTask> task, const TransferRequest &request);
    void release(const TransferTask &task);
};

#endif
