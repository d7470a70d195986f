#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace brsplit
{
namespace common
{

// FixedThreadPool runs tasks on `num` workers in FIFO order. stop() lets the
// workers drain the queue before joining them.
class FixedThreadPool
{
public:
    using Task = std::function<void()>;
    explicit FixedThreadPool(size_t num_, const std::string & name_ = "SplitWorker")
        : num(num_ == 0 ? 1 : num_)
        , name(name_)
        , stopped(false)
    {}
    ~FixedThreadPool() { stop(); }

    void start();

    void enqueue(const Task & task);

    void stop();

private:
    void loop();

    size_t num;
    std::string name;
    bool stopped;
    std::vector<std::thread> threads;
    std::queue<Task> tasks;
    std::mutex mu;
    std::condition_variable cond;
};

} // namespace common
} // namespace brsplit
