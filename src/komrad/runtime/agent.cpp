#include "komrad/runtime/agent.hpp"
#include "komrad/runtime.hpp"

namespace komrad {

Agent::Agent(Runtime& rt, std::string name) : rt_(rt), name_(std::move(name)), id_(rt.next_id()) {}

AgentHandle::AgentHandle(std::shared_ptr<Agent> a) : agent_(std::move(a)) {
    if(agent_) agent_->acquire_sender();
}

AgentHandle::~AgentHandle(){
    if(agent_) agent_->release_sender();
}

agent_ref make_ref(std::shared_ptr<Agent> a){
    return agent_ref{std::make_shared<AgentHandle>(std::move(a))};
}

void ReplySlot::fulfill(value v){
    { std::lock_guard<std::mutex> lk(mu); result = std::move(v); done = true; }
    cv.notify_all();
}

void ReplySlot::fail(std::string code, std::string message){
    { std::lock_guard<std::mutex> lk(mu); error_code = std::move(code); error = std::move(message); done = true; }
    cv.notify_all();
}

std::string describe(const std::vector<value>& tokens){
    std::string out = "[";
    for(size_t i=0;i<tokens.size();++i){
        if(i) out += ' ';
        out += to_string(tokens[i]);
    }
    return out + "]";
}

} // namespace komrad
