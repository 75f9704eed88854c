#include "test_env.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace komrad;

#if defined(_WIN32)
static void set_var(const std::string& name, const char* value){ _putenv_s(name.c_str(), value ? value : ""); }
#else
static void set_var(const std::string& name, const char* value){
    if(value) ::setenv(name.c_str(), value, 1);
    else ::unsetenv(name.c_str());
}
#endif

ScopedEnv::ScopedEnv(const char* name, const char* value) : name_(name) {
    if(const char* old = std::getenv(name)) previous_ = old;
    set_var(name_, value);
}

ScopedEnv::~ScopedEnv(){ set_var(name_, previous_ ? previous_->c_str() : nullptr); }

TestRuntime::TestRuntime(unsigned workers, std::chrono::milliseconds replyTimeout){
    RuntimeEnv e;
    e.workers = workers;
    e.replyTimeout = replyTimeout;
    e.quiet = true;
    rt = std::make_unique<Runtime>(e, out);
}

bool TestRuntime::run(const std::string& src, std::chrono::milliseconds timeout){
    module = rt->load(Parser().parse(src, "<test>"));
    return idle(timeout);
}

bool TestRuntime::idle(std::chrono::milliseconds timeout){ return rt->wait_idle(timeout); }

std::optional<value> TestRuntime::field(const std::string& name) const { return rt->field(module, name); }

agent_ref TestRuntime::ref(const std::string& name) const {
    auto v = field(name);
    if(!v || !as_ref(*v)) throw std::runtime_error("module field '" + name + "' is not an agent reference");
    return *as_ref(*v);
}

std::optional<value> TestRuntime::field_of(const std::string& holder, const std::string& name) const {
    return rt->field(ref(holder), name);
}

std::size_t TestRuntime::count(const char* code) const { return rt->diagnostics().count(code); }

std::optional<std::int64_t> as_int(const std::optional<value>& v){
    if(!v) return std::nullopt;
    if(auto i = std::get_if<std::int64_t>(&v->data)) return *i;
    return std::nullopt;
}
