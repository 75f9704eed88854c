#include "komrad/runtime/mailbox.hpp"

namespace komrad {

Mailbox::Push Mailbox::push(Envelope e){
    std::lock_guard<std::mutex> lk(mu_);
    if(closed_) return Push::Closed;
    queue_.push_back(std::move(e));
    if(scheduled_) return Push::Queued;
    scheduled_ = true;
    return Push::Schedule;
}

Mailbox::Next Mailbox::next(){
    std::lock_guard<std::mutex> lk(mu_);
    Next n;
    if(closed_){ scheduled_ = false; return n; }
    if(queue_.empty()){
        scheduled_ = false;
        n.collect = senders_==0;
        return n;
    }
    n.envelope = std::move(queue_.front());
    queue_.pop_front();
    return n;
}

std::vector<Envelope> Mailbox::close(){
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    std::vector<Envelope> rest(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
    return rest;
}

void Mailbox::add_sender(){
    std::lock_guard<std::mutex> lk(mu_);
    ++senders_;
}

bool Mailbox::remove_sender(){
    std::lock_guard<std::mutex> lk(mu_);
    if(senders_) --senders_;
    return senders_==0 && !scheduled_ && queue_.empty() && !closed_;
}

} // namespace komrad
