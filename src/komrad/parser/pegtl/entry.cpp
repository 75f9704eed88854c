#include "komrad/parser.hpp"
#include "grammar.hpp"
#include "lower.hpp"

namespace komrad {

parse_error::parse_error(const std::string& source, source_span at, const std::string& message, std::string expected_, std::string found_)
    : std::runtime_error(source + ":" + std::to_string(at.line) + ":" + std::to_string(at.col) + ": " + message),
      span(at), detail(message), expected(std::move(expected_)), found(std::move(found_)) {}

namespace {

std::string describe_found(const std::string& text, std::size_t byte){
    if(byte >= text.size()) return "end of input";
    char c = text[byte];
    if(c=='\n') return "newline";
    if(c=='\t') return "tab";
    return std::string("'") + c + "'";
}

// Strip UTF-8 BOM if present to avoid parse-at-EOF issues on some editors
std::string normalized(std::string_view src){
    std::string s(src);
    if(s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF){
        s.erase(0, 3);
    }
    return s;
}

template<typename Rule>
std::unique_ptr<pegtl_front::tree_node> run(const std::string& text, const std::string& source){
    namespace g = pegtl_front::grammar;
    try {
        tao::pegtl::memory_input in(text, source);
        auto root = tao::pegtl::parse_tree::parse< Rule, g::selector, tao::pegtl::nothing, g::control >(in);
        if(!root) throw parse_error(source, source_span{0, 1, 1}, "parse failed");
        return root;
    } catch (const tao::pegtl::parse_error& e) {
        source_span at{0, 0, 0};
        if(!e.positions().empty()){
            const auto& p = e.positions().front();
            at = source_span{p.byte, static_cast<int>(p.line), static_cast<int>(p.column)};
        }
        std::string expected(e.message());
        std::string found = describe_found(text, at.byte);
        throw parse_error(source, at, "expected " + expected + ", found " + found, expected, found);
    }
}

} // namespace

program_ptr Parser::parse(std::string_view src, std::string_view filename) const {
    std::string text = normalized(src);
    std::string source(filename);
    auto root = run<pegtl_front::grammar::module_rule>(text, source);
    return pegtl_front::Lowering(source).module(*root);
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    ParseResult r; r.success = false;
    try {
        r.program = parse(src, filename);
        r.success = true;
    } catch (const parse_error& e) {
        r.error_message = e.what();
        r.detail = e.detail;
        r.expected = e.expected;
        r.found = e.found;
        r.byte = e.span.byte;
        r.line = e.span.line;
        r.column = e.span.col;
    }
    return r;
}

pattern Parser::parse_pattern(std::string_view src) const {
    std::string text = normalized(src);
    auto first = text.find_first_not_of(" \t\r\n");
    if(first==std::string::npos || text[first]!='[') text = "[" + text + "]";
    auto root = run<pegtl_front::grammar::pattern_rule>(text, "<pattern>");
    return pegtl_front::Lowering("<pattern>").pattern_of(*root->children.at(0));
}

expr_ptr Parser::parse_expression(std::string_view src) const {
    std::string text = normalized(src);
    auto root = run<pegtl_front::grammar::expression_rule>(text, "<expression>");
    return pegtl_front::Lowering("<expression>").expression(*root->children.at(0));
}

} // namespace komrad
