// agent.hpp - common base of user instances and system agents, sender-counted handles, message records
#pragma once
#include "komrad/value.hpp"
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace komrad {

class Runtime;

class Agent : public std::enable_shared_from_this<Agent> {
public:
    Agent(Runtime& rt, std::string name);
    virtual ~Agent() = default;
    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& name() const { return name_; }
    std::uint64_t id() const { return id_; }
    std::string label() const { return name_ + "#" + std::to_string(id_); }
    Runtime& runtime() const { return rt_; }

    virtual bool is_native() const = 0;
    // Called by AgentHandle construction/destruction.
    virtual void acquire_sender() {}
    virtual void release_sender() {}

protected:
    Runtime& rt_;
    std::string name_;
    std::uint64_t id_;
};

// One counted sender of an agent. agent_ref copies share a handle.
class AgentHandle {
public:
    explicit AgentHandle(std::shared_ptr<Agent> a);
    ~AgentHandle();
    AgentHandle(const AgentHandle&) = delete;
    AgentHandle& operator=(const AgentHandle&) = delete;

    const std::shared_ptr<Agent>& agent() const { return agent_; }

private:
    std::shared_ptr<Agent> agent_;
};

// Creates a fresh handle (one more sender) for the agent.
agent_ref make_ref(std::shared_ptr<Agent> a);

// Completion slot for a send whose result is awaited.
struct ReplySlot {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    value result;
    std::string error_code; // empty on success
    std::string error;

    void fulfill(value v);
    void fail(std::string code, std::string message);
};

struct Message {
    std::vector<value> tokens; // tokens[0] is normally the selector word
    std::shared_ptr<ReplySlot> reply; // null for fire-and-forget sends
};

// "[inc 1 \"a\"]" rendering used in diagnostics and traces.
std::string describe(const std::vector<value>& tokens);

} // namespace komrad
