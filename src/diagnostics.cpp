#include "komrad/diagnostics.hpp"
#include <algorithm>
#include <cstdio>

namespace komrad {

std::string format(const Diagnostic& d){
    std::string out = "[komrad][";
    out += d.severity==Severity::Error ? "error" : "warn";
    out += "][" + d.code + "] ";
    if(!d.agent.empty()) out += d.agent + ": ";
    out += d.message;
    if(d.line > 0) out += " (" + std::to_string(d.line) + ":" + std::to_string(d.col) + ")";
    if(!d.hint.empty()) out += " hint: " + d.hint;
    return out;
}

void DiagnosticSink::report(Diagnostic d){
    std::lock_guard<std::mutex> lk(mu_);
    if(!quiet_) std::fprintf(stderr, "%s\n", format(d).c_str());
    items_.push_back(std::move(d));
}

std::vector<Diagnostic> DiagnosticSink::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_;
}

std::size_t DiagnosticSink::count(const std::string& code) const {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [&](const Diagnostic& d){ return d.code==code; }));
}

bool DiagnosticSink::has_errors() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::any_of(items_.begin(), items_.end(), [](const Diagnostic& d){ return d.severity==Severity::Error; });
}

void DiagnosticSink::clear(){
    std::lock_guard<std::mutex> lk(mu_);
    items_.clear();
}

} // namespace komrad
