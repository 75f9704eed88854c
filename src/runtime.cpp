#include "komrad/runtime.hpp"
#include "komrad/runtime/instance.hpp"
#include "komrad/runtime/native_agent.hpp"
#include "komrad/runtime/system_agents.hpp"
#include <cstdio>

namespace komrad {

Runtime::Runtime(RuntimeEnv env, std::ostream& out)
    : env_(env), out_(out), diags_(env.quiet),
      globals_(std::make_shared<Scope>()), globals_view_(globals_),
      scheduler_(std::make_unique<Scheduler>(effective_workers(env_), env_.debug)) {
    install_system_agents(*this);
}

Runtime::~Runtime(){ shutdown(); }

void Runtime::define(agent_def_ptr def){
    std::lock_guard<std::mutex> lk(defs_mu_);
    defs_[def->name] = std::move(def);
}

agent_def_ptr Runtime::definition(const std::string& name) const {
    std::lock_guard<std::mutex> lk(defs_mu_);
    auto it = defs_.find(name);
    return it==defs_.end() ? nullptr : it->second;
}

void Runtime::register_agent(const std::shared_ptr<NativeAgent>& agent){
    auto ref = make_ref(agent);
    globals_->set(agent->name(), v_ref(ref));
    system_refs_.push_back(std::move(ref));
}

std::optional<agent_ref> Runtime::lookup(const std::string& name) const {
    auto v = globals_->get(name);
    if(!v) return std::nullopt;
    if(auto r = as_ref(*v)) return *r;
    return std::nullopt;
}

void Runtime::track(const std::shared_ptr<Instance>& inst){
    std::lock_guard<std::mutex> lk(inst_mu_);
    instances_[inst->id()] = inst;
}

void Runtime::forget(std::uint64_t id){
    std::shared_ptr<Instance> dropped;
    std::lock_guard<std::mutex> lk(inst_mu_);
    auto it = instances_.find(id);
    if(it==instances_.end()) return;
    dropped = std::move(it->second);
    instances_.erase(it);
}

std::size_t Runtime::live_instances() const {
    std::lock_guard<std::mutex> lk(inst_mu_);
    return instances_.size();
}

agent_ref Runtime::spawn(const agent_def_ptr& def, value_map overrides){
    if(stopped_) throw eval_error(codes::Delivery, "cannot spawn " + def->name + ": runtime is shut down");
    auto inst = std::make_shared<Instance>(*this, def);
    track(inst);
    // The sender is counted before Init is queued so the new instance is never collected early.
    agent_ref ref = make_ref(inst);
    Envelope init;
    init.kind = Envelope::Kind::Init;
    init.overrides = std::move(overrides);
    inst->post(std::move(init));
    if(env_.debug) std::fprintf(stderr, "[dbg][sched] spawned %s\n", inst->label().c_str());
    return ref;
}

agent_ref Runtime::spawn(const std::string& name, value_map overrides){
    auto def = definition(name);
    if(!def) throw eval_error(codes::UnknownAgent, "unknown agent definition '" + name + "'");
    return spawn(def, std::move(overrides));
}

agent_ref Runtime::load(const program_ptr& p){
    for(const auto& d : agent_defs(*p)) define(d);
    auto mod = std::make_shared<agent_def>();
    mod->name = "module";
    mod->handlers = module_handlers(*p);
    for(const auto& s : p->statements){
        if(std::holds_alternative<agent_decl>(s->data) || std::holds_alternative<handler_decl>(s->data)) continue;
        mod->defaults.push_back(s);
    }
    bool has_main = false;
    for(const auto& h : mod->handlers){
        if(h->pat.tokens.empty()) continue;
        if(auto w = std::get_if<word_token>(&h->pat.tokens.front()); w && w->text=="main") has_main = true;
    }
    auto ref = spawn(agent_def_ptr(mod));
    {
        std::lock_guard<std::mutex> lk(inst_mu_);
        modules_.push_back(ref);
    }
    if(has_main) send(ref, {v_word("main")});
    return ref;
}

void Runtime::send(const agent_ref& target, std::vector<value> tokens){
    deliver(target, std::move(tokens), false, nullptr);
}

value Runtime::request(const agent_ref& target, std::vector<value> tokens){
    return deliver(target, std::move(tokens), true, nullptr);
}

value Runtime::deliver(const agent_ref& target, std::vector<value> tokens, bool want_reply, Evaluator* caller, source_span at){
    Agent* a = target.get();
    if(!a) throw eval_error(codes::Delivery, "send to an empty agent reference", at);
    const Agent* from = caller ? caller->self().get() : nullptr;
    if(env_.debug){
        std::fprintf(stderr, "[dbg][dispatch] %s -> %s %s%s\n", from ? from->label().c_str() : "host",
                     a->label().c_str(), describe(tokens).c_str(), want_reply ? " (awaiting reply)" : "");
    }
    if(a->is_native()){
        auto& native = static_cast<NativeAgent&>(*a);
        if(caller) return native.invoke(tokens, want_reply, *caller, at);
        Evaluator host(*this, nullptr);
        return native.invoke(tokens, want_reply, host, at);
    }
    auto inst = std::static_pointer_cast<Instance>(target.handle->agent());
    if(want_reply && caller && caller->self()==inst) return inst->dispatch_inline(tokens, *caller, at);

    const word* sel = tokens.size()==1 ? std::get_if<word>(&tokens.front().data) : nullptr;
    bool terminate = sel && sel->text=="terminate";
    std::string what = describe(tokens);
    Envelope e;
    e.kind = terminate ? Envelope::Kind::Terminate : Envelope::Kind::Deliver;
    std::shared_ptr<ReplySlot> slot;
    if(want_reply && !terminate) slot = std::make_shared<ReplySlot>();
    e.msg = Message{std::move(tokens), slot};
    if(!inst->post(std::move(e))){
        report(codes::Delivery, "cannot deliver " + what + " to " + inst->label() + ": agent terminated", from, at);
        return v_unit();
    }
    if(!slot) return v_unit();
    return await(*slot, at);
}

value Runtime::await(ReplySlot& slot, source_span at){
    auto deadline = std::chrono::steady_clock::now() + env_.replyTimeout;
    for(;;){
        {
            std::lock_guard<std::mutex> lk(slot.mu);
            if(slot.done) break;
        }
        if(stopped_) throw eval_error(codes::Delivery, "runtime shut down while awaiting a reply", at);
        if(std::chrono::steady_clock::now() >= deadline){
            throw eval_error(codes::ReplyTimeout, "no reply within " + std::to_string(env_.replyTimeout.count()) + " ms", at);
        }
        // Help with queued work so that waiting never starves the pool.
        if(!scheduler_->run_one()){
            std::unique_lock<std::mutex> lk(slot.mu);
            slot.cv.wait_for(lk, std::chrono::milliseconds(2), [&]{ return slot.done; });
        }
    }
    std::lock_guard<std::mutex> lk(slot.mu);
    if(!slot.error_code.empty()) throw eval_error(slot.error_code, slot.error, at);
    return slot.result;
}

void Runtime::begin_message(){
    std::lock_guard<std::mutex> lk(idle_mu_);
    ++outstanding_;
}

void Runtime::end_message(){
    bool idle = false;
    {
        std::lock_guard<std::mutex> lk(idle_mu_);
        if(outstanding_) --outstanding_;
        idle = outstanding_==0;
    }
    if(idle) idle_cv_.notify_all();
}

bool Runtime::wait_idle(std::chrono::milliseconds timeout){
    std::unique_lock<std::mutex> lk(idle_mu_);
    return idle_cv_.wait_for(lk, timeout, [&]{ return outstanding_==0; });
}

std::optional<value> Runtime::field(const agent_ref& target, const std::string& name) const {
    if(!target || !target.handle->agent() || target.handle->agent()->is_native()) return std::nullopt;
    auto inst = std::static_pointer_cast<Instance>(target.handle->agent());
    return inst->fields()->get(name);
}

void Runtime::report(const std::string& code, const std::string& message, const Agent* who, source_span at, Severity sev,
                     std::string hint){
    Diagnostic d;
    d.code = code;
    d.message = message;
    d.hint = std::move(hint);
    d.agent = who ? who->label() : std::string();
    d.line = at.line;
    d.col = at.col;
    d.severity = sev;
    diags_.report(std::move(d));
}

void Runtime::shutdown(){
    if(stopped_.exchange(true)) return;
    scheduler_->stop();
    std::vector<std::shared_ptr<Instance>> live;
    std::vector<agent_ref> modules;
    {
        std::lock_guard<std::mutex> lk(inst_mu_);
        for(auto& kv : instances_) live.push_back(kv.second);
        modules.swap(modules_);
    }
    for(auto& inst : live) inst->stop(false);
    live.clear();
    modules.clear();
    globals_->clear();
    system_refs_.clear();
    if(env_.debug) std::fprintf(stderr, "[dbg][sched] runtime shut down\n");
}

} // namespace komrad
