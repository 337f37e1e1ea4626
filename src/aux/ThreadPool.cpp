#include <spdlog/spdlog.h>

#include "aux/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t nThreads)
    : _stop(false)
{
    if (nThreads == 0)
        nThreads = 1;

    for (size_t i = 0; i < nThreads; ++i)
    {
        _workers.emplace_back(&ThreadPool::workerThread, this);
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> f)
{
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        if (_stop)
            return false;
        _tasks.push(std::move(f));
    }

    _condition.notify_one();
    return true;
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        _stop = true;
    }
    _condition.notify_all();

    for (auto &worker : _workers)
    {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
        {
            worker.join();
        }
    }
}

// Runs queued work until the pool stops and the queue is empty
void ThreadPool::workerThread()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(_queueMutex);
            _condition.wait(lock, [this]
                            { return _stop || !_tasks.empty(); });

            if (_stop && _tasks.empty())
                return;

            task = std::move(_tasks.front());
            _tasks.pop();
        }

        // One failing job must not take the worker down with it
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            spdlog::error("Worker job failed: {}", e.what());
        }
    }
}
