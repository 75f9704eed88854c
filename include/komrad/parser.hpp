#pragma once
#include "komrad/syntax.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace komrad {

// Structured parse failure: what() is "<source>:<line>:<col>: <message>".
struct parse_error : std::runtime_error {
    parse_error(const std::string& source, source_span at, const std::string& message, std::string expected = {}, std::string found = {});
    source_span span;
    std::string detail;   // message without the location prefix
    std::string expected; // empty when the failure is not an expected-token mismatch
    std::string found;
};

struct ParseResult {
    bool success{false};
    program_ptr program;       // set when success
    std::string error_message; // If !success, human-readable message with location
    std::string detail;        // same message without the location prefix
    std::string expected;
    std::string found;
    std::size_t byte{0};
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse a komrad module. Stops at the first error.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
    // Throwing form of parse_string.
    program_ptr parse(std::string_view src, std::string_view filename = "<memory>") const;
    // Pattern with or without surrounding brackets, e.g. "println _value".
    pattern parse_pattern(std::string_view src) const;
    expr_ptr parse_expression(std::string_view src) const;
};

} // namespace komrad
