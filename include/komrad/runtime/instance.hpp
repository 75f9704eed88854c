// instance.hpp - a spawned user agent: private fields, mailbox and sequential dispatch loop
#pragma once
#include "komrad/eval.hpp"
#include "komrad/runtime/agent.hpp"
#include "komrad/runtime/mailbox.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace komrad {

class Instance : public Agent {
public:
    Instance(Runtime& rt, agent_def_ptr def);

    bool is_native() const override { return false; }
    const agent_def& definition() const { return *def_; }
    const scope_ptr& fields() const { return fields_; }
    // Instance fields over the runtime globals, with no local frames.
    env_ptr base_env() const;

    // Queues an envelope and schedules the instance if it was idle. False once the mailbox is closed.
    bool post(Envelope e);
    // Runs the first matching handler on the calling thread. Only valid from this instance's own dispatch.
    value dispatch_inline(const std::vector<value>& tokens, Evaluator& ev, source_span at);

    // Closes the mailbox, fails what is still queued and releases the field scope.
    void stop(bool by_directive);
    bool stopped() const { return stopped_.load(); }

    void acquire_sender() override;
    void release_sender() override;

private:
    static constexpr int kBatch = 32;

    std::shared_ptr<Instance> shared();
    void schedule();
    void drain();
    void process(Envelope& e);
    void initialize(const value_map& overrides);
    void handle(Message& m);

    agent_def_ptr def_;
    scope_ptr fields_;
    Mailbox mailbox_;
    std::atomic<bool> stopped_{false};
};

} // namespace komrad
