// diagnostics.hpp - runtime diagnostic records and the thread-safe sink that collects them
#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace komrad {

namespace codes {
inline constexpr const char* Parse = "K1001";
inline constexpr const char* UnresolvedVariable = "K2001";
inline constexpr const char* TypeMismatch = "K2002";
inline constexpr const char* Arity = "K2003";
inline constexpr const char* DivisionByZero = "K2004";
inline constexpr const char* NoHandler = "K2005";
inline constexpr const char* ReplyTimeout = "K2006";
inline constexpr const char* UnknownAgent = "K2007";
inline constexpr const char* Intrinsic = "K2008";
inline constexpr const char* UnhandledMessage = "K3001";
inline constexpr const char* Delivery = "K4001";
}

enum class Severity { Error, Warning };

struct Diagnostic {
    std::string code;
    std::string message;
    std::string hint;
    std::string agent; // "<name>#<id>" of the reporting instance, empty for the host
    int line = 0;
    int col = 0;
    Severity severity = Severity::Error;
};

class DiagnosticSink {
public:
    explicit DiagnosticSink(bool quiet = false) : quiet_(quiet) {}
    // Record and (unless quiet) print "[komrad][error][K2001] agent: message (line:col)" to stderr.
    void report(Diagnostic d);
    std::vector<Diagnostic> snapshot() const;
    std::size_t count(const std::string& code) const;
    bool has_errors() const;
    void clear();
private:
    mutable std::mutex mu_;
    std::vector<Diagnostic> items_;
    bool quiet_;
};

std::string format(const Diagnostic& d);

} // namespace komrad
