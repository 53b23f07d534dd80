/*
 * DispatchPool.cpp
 *
 *  Worker threads for asynchronous dispatch.
 */

#include "../headers/autopo_internal.h"

namespace autopo
{
    DispatchPool::DispatchPool(unsigned int workers)
    {
        if (workers == 0)
            throw std::invalid_argument("DispatchPool needs at least one worker");
        this->workers.reserve(workers);
        for (unsigned int i = 0; i < workers; ++i)
            this->workers.emplace_back(&DispatchPool::workerLoop, this);
    }

    DispatchPool::~DispatchPool()
    {
        shutdown();
    }

    void DispatchPool::submit(std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping)
                throw std::logic_error("DispatchPool::submit after shutdown");
            queue.push_back(std::move(task));
        }
        available.notify_one();
    }

    void DispatchPool::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        available.notify_all();
        for (auto& worker : workers)
        {
            if (worker.joinable())
                worker.join();
        }
    }

    void DispatchPool::workerLoop()
    {
        while (true)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                available.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty())
                    return;
                task = std::move(queue.front());
                queue.pop_front();
            }
            task();
        }
    }
}
