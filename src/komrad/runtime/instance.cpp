#include "komrad/runtime/instance.hpp"
#include "komrad/runtime/matcher.hpp"
#include "komrad/runtime.hpp"
#include <algorithm>
#include <cstdio>

namespace komrad {

static std::string accepted_patterns(const std::vector<handler_ptr>& handlers){
    if(handlers.empty()) return "no handlers defined";
    std::string out = "accepts";
    for(const auto& h : handlers) out += " " + to_string(h->pat);
    return out;
}

Instance::Instance(Runtime& rt, agent_def_ptr def)
    : Agent(rt, def->name), def_(std::move(def)), fields_(std::make_shared<Scope>()) {}

std::shared_ptr<Instance> Instance::shared(){ return std::static_pointer_cast<Instance>(shared_from_this()); }

env_ptr Instance::base_env() const { return std::make_shared<Env>(fields_, rt_.globals()); }

void Instance::acquire_sender(){ mailbox_.add_sender(); }

void Instance::release_sender(){
    if(mailbox_.remove_sender()){
        if(rt_.env().debug) std::fprintf(stderr, "[dbg][sched] %s unreachable, collecting\n", label().c_str());
        stop(false);
    }
}

bool Instance::post(Envelope e){
    rt_.begin_message();
    auto r = mailbox_.push(std::move(e));
    if(r==Mailbox::Push::Closed){ rt_.end_message(); return false; }
    if(r==Mailbox::Push::Schedule) schedule();
    return true;
}

void Instance::schedule(){
    auto self = shared();
    rt_.scheduler().submit([self]{ self->drain(); });
}

void Instance::drain(){
    for(int i=0;i<kBatch;++i){
        auto n = mailbox_.next();
        if(!n.envelope){
            if(n.collect) stop(false);
            return;
        }
        process(*n.envelope);
        rt_.end_message();
    }
    // Batch exhausted: requeue behind other ready instances.
    schedule();
}

void Instance::process(Envelope& e){
    switch(e.kind){
        case Envelope::Kind::Init: initialize(e.overrides); break;
        case Envelope::Kind::Terminate:
            if(rt_.env().debug) std::fprintf(stderr, "[dbg][dispatch] %s terminating\n", label().c_str());
            stop(true);
            break;
        case Envelope::Kind::Deliver: handle(e.msg); break;
    }
}

void Instance::initialize(const value_map& overrides){
    std::vector<std::string> overridden;
    for(const auto& kv : overrides){
        auto name = as_text(kv.first);
        if(!name){
            rt_.report(codes::TypeMismatch, std::string("configuration key must be a String or Word, got ") + type_name(kv.first), this);
            continue;
        }
        fields_->set(*name, kv.second);
        overridden.push_back(*name);
    }
    auto is_overridden = [&](const std::string& n){ return std::find(overridden.begin(), overridden.end(), n)!=overridden.end(); };

    Evaluator ev(rt_, shared());
    auto env = base_env();
    try {
        for(const auto& s : def_->defaults){
            if(auto a = std::get_if<assignment>(&s->data); a && is_overridden(a->name)) continue;
            if(auto f = std::get_if<field_decl>(&s->data); f && is_overridden(f->name)){
                auto current = fields_->get(f->name);
                ev.declare_field(*f, env, &*current, s->span);
                continue;
            }
            ev.execute(*s, env);
        }
    } catch (const eval_error& e) {
        rt_.report(e.code, e.what(), this, e.span);
    } catch (const std::exception& e) {
        rt_.report(codes::Intrinsic, e.what(), this);
    }
}

void Instance::handle(Message& m){
    Evaluator ev(rt_, shared());
    Matcher matcher(ev);
    try {
        auto match = matcher.select(def_->handlers, m.tokens, base_env());
        if(!match){
            std::string msg = "no handler matches " + describe(m.tokens);
            rt_.report(codes::UnhandledMessage, msg, this, {}, Severity::Warning, accepted_patterns(def_->handlers));
            if(m.reply) m.reply->fail(codes::NoHandler, label() + ": " + msg);
            return;
        }
        if(rt_.env().debug){
            std::fprintf(stderr, "[dbg][dispatch] %s <- %s via %s\n", label().c_str(), describe(m.tokens).c_str(), to_string(match->handler->pat).c_str());
        }
        value r = ev.run(*match->handler->body, match->env);
        if(m.reply) m.reply->fulfill(std::move(r));
    } catch (const eval_error& e) {
        rt_.report(e.code, e.what(), this, e.span);
        if(m.reply) m.reply->fail(e.code, e.what());
    } catch (const std::exception& e) {
        rt_.report(codes::Intrinsic, e.what(), this);
        if(m.reply) m.reply->fail(codes::Intrinsic, e.what());
    }
}

value Instance::dispatch_inline(const std::vector<value>& tokens, Evaluator& ev, source_span at){
    Matcher matcher(ev);
    auto match = matcher.select(def_->handlers, tokens, base_env());
    if(!match) throw eval_error(codes::NoHandler, "no handler of " + label() + " matches " + describe(tokens), at);
    if(rt_.env().debug){
        std::fprintf(stderr, "[dbg][dispatch] %s <- %s inline via %s\n", label().c_str(), describe(tokens).c_str(), to_string(match->handler->pat).c_str());
    }
    return ev.run(*match->handler->body, match->env);
}

void Instance::stop(bool by_directive){
    bool expected = false;
    if(!stopped_.compare_exchange_strong(expected, true)) return;
    auto rest = mailbox_.close();
    for(auto& e : rest){
        if(e.kind==Envelope::Kind::Deliver){
            std::string msg = describe(e.msg.tokens) + " dropped: " + label() + " terminated";
            if(by_directive) rt_.report(codes::Delivery, msg, this);
            if(e.msg.reply) e.msg.reply->fail(codes::Delivery, msg);
        }
        rt_.end_message();
    }
    if(rt_.env().debug) std::fprintf(stderr, "[dbg][sched] %s stopped (%s)\n", label().c_str(), by_directive ? "terminate" : "unreachable");
    fields_->clear();
    rt_.forget(id_);
}

} // namespace komrad
