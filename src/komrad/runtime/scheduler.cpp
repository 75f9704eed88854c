#include "komrad/runtime/scheduler.hpp"
#include <cstdio>

namespace komrad {

Scheduler::Scheduler(unsigned workers, bool debug) : debug_(debug) {
    if(workers==0) workers = 1;
    workers_.reserve(workers);
    for(unsigned i=0;i<workers;++i) workers_.emplace_back([this, i]{ worker_loop(i); });
    if(debug_) std::fprintf(stderr, "[dbg][sched] started %u workers\n", workers);
}

Scheduler::~Scheduler(){ stop(); }

void Scheduler::submit(std::function<void()> task){
    {
        std::lock_guard<std::mutex> lk(mu_);
        if(stopping_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

bool Scheduler::run_one(){
    std::function<void()> task;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if(tasks_.empty()) return false;
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }
    task();
    return true;
}

void Scheduler::stop(){
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if(stopping_ && workers_.empty()) return;
        stopping_ = true;
        dropped.swap(tasks_);
    }
    cv_.notify_all();
    for(auto& t : workers_){
        if(t.joinable() && t.get_id()!=std::this_thread::get_id()) t.join();
        else if(t.joinable()) t.detach();
    }
    workers_.clear();
    if(debug_ && !dropped.empty()) std::fprintf(stderr, "[dbg][sched] dropped %zu queued tasks at stop\n", dropped.size());
}

void Scheduler::worker_loop(unsigned index){
    for(;;){
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&]{ return stopping_ || !tasks_.empty(); });
            if(stopping_) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
    if(debug_) std::fprintf(stderr, "[dbg][sched] worker %u exiting\n", index);
}

} // namespace komrad
