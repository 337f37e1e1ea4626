#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

// Fixed set of worker threads. Work accepted before shutdown() is always
// run, so every admitted transfer gets the chance to publish its terminal
// snapshot.
class ThreadPool
{
public:
    explicit ThreadPool(size_t nThreads);
    ~ThreadPool();

    // Returns false once the pool is shutting down
    bool enqueue(std::function<void()> func);

    // Drains queued work and joins all workers, safe to call twice
    void shutdown();

private:
    void workerThread();

    std::vector<std::thread> _workers;
    std::queue<std::function<void()>> _tasks;
    mutable std::mutex _queueMutex;
    std::condition_variable _condition;
    bool _stop;
};

#endif
