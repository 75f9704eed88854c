// runtime.hpp - owns instances, the worker pool, system agents and the diagnostic sink
#pragma once
#include "komrad/config.hpp"
#include "komrad/diagnostics.hpp"
#include "komrad/eval.hpp"
#include "komrad/runtime/agent.hpp"
#include "komrad/runtime/scheduler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace komrad {

class Instance;
class NativeAgent;

class Runtime {
public:
    explicit Runtime(RuntimeEnv env = detect_env(), std::ostream& out = std::cout);
    ~Runtime();
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Registers the program's definitions and starts its module instance.
    // Top-level statements run as the module's first message; `main` follows when a module handler takes it.
    agent_ref load(const program_ptr& p);

    void define(agent_def_ptr def);
    agent_def_ptr definition(const std::string& name) const;

    // Never blocks on the new instance doing any work.
    agent_ref spawn(const agent_def_ptr& def, value_map overrides = {});
    agent_ref spawn(const std::string& definition, value_map overrides = {});

    // Makes a system agent addressable by name from every program.
    void register_agent(const std::shared_ptr<NativeAgent>& agent);
    std::optional<agent_ref> lookup(const std::string& name) const;

    // Fire-and-forget entry point for hosts and external event sources.
    void send(const agent_ref& target, std::vector<value> tokens);
    // Sends and waits for the handler's result; failures surface as eval_error.
    value request(const agent_ref& target, std::vector<value> tokens);
    // Common delivery path. caller is the evaluator of the sending instance, or null for the host.
    value deliver(const agent_ref& target, std::vector<value> tokens, bool want_reply, Evaluator* caller, source_span at = {});

    // Waits until no message is queued or being processed. False on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);
    // Current value of an instance field, for tools and tests.
    std::optional<value> field(const agent_ref& target, const std::string& name) const;
    // Stops every instance and joins the worker pool. Idempotent.
    void shutdown();

    void report(const std::string& code, const std::string& message, const Agent* who = nullptr, source_span at = {}, Severity sev = Severity::Error,
                std::string hint = {});
    DiagnosticSink& diagnostics() { return diags_; }
    const DiagnosticSink& diagnostics() const { return diags_; }
    const RuntimeEnv& env() const { return env_; }
    std::ostream& out() { return out_; }
    std::mutex& out_mutex() { return out_mu_; }
    Scheduler& scheduler() { return *scheduler_; }
    const std::shared_ptr<const Scope>& globals() const { return globals_view_; }
    std::size_t live_instances() const;

    // Bookkeeping used by instances.
    std::uint64_t next_id() { return ++ids_; }
    void begin_message();
    void end_message();
    void forget(std::uint64_t id);

private:
    value await(ReplySlot& slot, source_span at);
    void track(const std::shared_ptr<Instance>& inst);

    RuntimeEnv env_;
    std::ostream& out_;
    std::mutex out_mu_;
    DiagnosticSink diags_;
    std::atomic<std::uint64_t> ids_{0};

    std::shared_ptr<Scope> globals_;
    std::shared_ptr<const Scope> globals_view_;
    std::vector<agent_ref> system_refs_;

    mutable std::mutex defs_mu_;
    std::map<std::string, agent_def_ptr> defs_;

    mutable std::mutex inst_mu_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Instance>> instances_;
    std::vector<agent_ref> modules_;

    std::mutex idle_mu_;
    std::condition_variable idle_cv_;
    std::size_t outstanding_ = 0;

    std::unique_ptr<Scheduler> scheduler_;
    std::atomic<bool> stopped_{false};
};

} // namespace komrad
