// scheduler.hpp - shared worker pool that runs instance dispatch batches
#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace komrad {

class Scheduler {
public:
    explicit Scheduler(unsigned workers, bool debug = false);
    ~Scheduler();
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Tasks must not throw. Submissions after stop() are discarded.
    void submit(std::function<void()> task);
    // Runs one queued task on the calling thread; false when nothing was queued.
    bool run_one();
    // Stops accepting work, drains nothing further and joins the workers.
    void stop();
    unsigned size() const { return static_cast<unsigned>(workers_.size()); }

private:
    void worker_loop(unsigned index);

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
    bool debug_ = false;
};

} // namespace komrad
