// mailbox.hpp - per-instance FIFO queue with scheduling and sender bookkeeping
#pragma once
#include "komrad/runtime/agent.hpp"
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace komrad {

struct Envelope {
    enum class Kind { Init, Deliver, Terminate };
    Kind kind = Kind::Deliver;
    Message msg;
    value_map overrides; // Init only
};

class Mailbox {
public:
    enum class Push { Queued, Schedule, Closed };
    // Schedule means the owner was idle and must be submitted to the scheduler.
    Push push(Envelope e);

    struct Next {
        std::optional<Envelope> envelope;
        bool collect = false; // empty, idle and unreachable
    };
    // Pops the next envelope. When the queue is empty the owner is marked idle.
    Next next();

    // Closes the mailbox and hands back whatever was still queued.
    std::vector<Envelope> close();

    void add_sender();
    // True when the last sender went away while the owner is idle with nothing queued.
    bool remove_sender();

private:
    mutable std::mutex mu_;
    std::deque<Envelope> queue_;
    std::size_t senders_ = 0;
    bool scheduled_ = false;
    bool closed_ = false;
};

} // namespace komrad
