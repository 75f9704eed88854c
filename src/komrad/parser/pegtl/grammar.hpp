#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <string>

namespace komrad::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace. Newlines separate statements, so intra-statement space excludes them.
struct comment_line : seq< two<'/'>, until< at< eolf > > > {};
struct block_comment_close : string<'*','/'> {};
struct block_comment : if_must< string<'/','*'>, until< block_comment_close > > {};
struct blank : sor< one<' ','\t','\r'>, block_comment > {};
struct sp0 : star< blank > {};
struct sp1 : plus< blank > {};
struct ws_any : sor< blank, eol, comment_line > {};
struct ws0 : star< ws_any > {};

// Identifiers: a '-' is only part of an identifier when another identifier character follows.
struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_char : ranges<'a','z','A','Z','0','9','_','_'> {};
struct ident_body : seq< ident_first, star< sor< ident_char, seq< one<'-'>, at< ident_char > > > > > {};

template<typename Word>
struct key : seq< Word, not_at< sor< ident_char, seq< one<'-'>, ident_char > > > > {};
struct kw_agent : key< string<'a','g','e','n','t'> > {};
struct kw_spawn : key< string<'s','p','a','w','n'> > {};
struct kw_true : key< string<'t','r','u','e'> > {};
struct kw_false : key< string<'f','a','l','s','e'> > {};
struct kw_unit : key< string<'u','n','i','t'> > {};
struct kw_self : key< string<'s','e','l','f'> > {};
struct reserved : sor< kw_agent, kw_spawn, kw_true, kw_false, kw_unit, kw_self > {};
struct identifier : seq< not_at< reserved >, ident_body > {};

// Numbers
struct sign : one<'+','-'> {};
struct digits : plus< digit > {};
struct exponent : seq< one<'e','E'>, opt< sign >, digits > {};
struct float_lit : seq< opt< sign >, digits, sor< seq< one<'.'>, digits, opt< exponent > >, exponent >, not_at< ident_char > > {};
struct int_lit : seq< opt< sign >, digits, not_at< ident_char >, not_at< one<'.'>, digit > > {};
struct number : sor< float_lit, int_lit > {};

// Strings
struct escape : seq< one<'\\'>, any > {};
struct triple_quote : string<'"','"','"'> {};
struct triple_close : triple_quote {};
struct triple_body : star< not_at< triple_quote >, sor< escape, any > > {};
struct triple_string : if_must< triple_quote, triple_body, triple_close > {};
struct dq_close : one<'"'> {};
struct dq_body : star< sor< escape, not_one<'"','\\'> > > {};
struct dq_string : if_must< one<'"'>, dq_body, dq_close > {};
struct sq_close : one<'\''> {};
struct sq_body : star< sor< escape, not_one<'\'','\\'> > > {};
struct sq_string : if_must< one<'\''>, sq_body, sq_close > {};
struct string_lit : sor< triple_string, dq_string, sq_string > {};

// Fenced raw text: ```tag1 tag2 <newline> text ```
struct fence : string<'`','`','`'> {};
struct fence_close : fence {};
struct embed_tag : ident_body {};
struct embed_tags : list< embed_tag, sor< seq< sp0, one<','>, sp0 >, sp1 > > {};
struct embed_eol : eol {};
struct embed_body : star< not_at< fence >, any > {};
struct embedded_text : if_must< fence, sp0, opt< embed_tags >, sp0, embed_eol, embed_body, fence_close > {};

// Operators
struct pipe_op : string<'|','>'> {};
struct or_op : two<'|'> {};
struct and_op : two<'&'> {};
struct eq_op : sor< string<'=','='>, string<'!','='> > {};
struct rel_op : sor< string<'<','='>, string<'>','='>, one<'<'>, one<'>'> > {};
struct add_op : one<'+','-'> {};
struct mul_op : sor< one<'*','%'>, seq< one<'/'>, not_at< one<'/','*'> > > > {};
struct not_op : seq< one<'!'>, not_at< one<'='> > > {};
struct assign_eq : seq< one<'='>, not_at< one<'='> > > {};
struct field_colon : seq< one<':'>, not_at< one<':'> > > {};

// Forward declarations for recursive rules
struct expression;
struct statement_list;
struct unary;

struct paren_close : one<')'> {};
struct paren_expr : if_must< one<'('>, ws0, expression, ws0, paren_close > {};
struct block_close : one<'}'> {};
struct block_lit : if_must< one<'{'>, statement_list, block_close > {};

struct arg;
struct list_close : one<']'> {};
struct list_sep : sor< seq< ws0, one<','>, ws0 >, plus< ws_any > > {};
struct list_lit : if_must< one<'['>, ws0, opt< list< arg, list_sep > >, ws0, opt< one<','>, ws0 >, list_close > {};

struct map_key_word : ident_body {};
struct map_colon : one<':'> {};
struct map_entry : seq< sor< string_lit, number, map_key_word >, sp0, must< map_colon >, ws0, must< expression > > {};
struct map_sep : seq< sp0, sor< one<','>, eol, comment_line >, ws0 > {};
struct map_close : one<'}'> {};
struct map_lit : if_must< string<'#','{'>, ws0, opt< list< map_entry, map_sep > >, ws0, opt< one<','>, ws0 >, map_close > {};

struct spawn_name : ident_body {};
struct spawn_config : sor< block_lit, map_lit, paren_expr, identifier > {};
struct spawn_expr : if_must< kw_spawn, sp1, spawn_name, opt< sp0, spawn_config > > {};

// Known-shape message arguments; an operand additionally allows spawn.
struct arg : sor< number, string_lit, embedded_text, kw_true, kw_false, kw_unit, kw_self, block_lit, list_lit, map_lit, paren_expr, identifier > {};
struct operand : sor< spawn_expr, arg > {};

// A send extends greedily over arguments on the same line.
struct send_expr : seq< operand, star< sp1, arg > > {};
struct not_expr : seq< not_op, sp0, must< unary > > {};
struct block_call : seq< one<'*'>, sp0, must< operand > > {};
struct unary : sor< not_expr, block_call, send_expr > {};
struct mul_expr : seq< unary, star< sp0, mul_op, sp0, must< unary > > > {};
struct add_expr : seq< mul_expr, star< sp0, add_op, sp0, must< mul_expr > > > {};
struct rel_expr : seq< add_expr, star< sp0, rel_op, sp0, must< add_expr > > > {};
struct eq_expr : seq< rel_expr, star< sp0, eq_op, sp0, must< rel_expr > > > {};
struct and_expr : seq< eq_expr, star< sp0, and_op, sp0, must< eq_expr > > > {};
struct or_expr : seq< and_expr, star< sp0, or_op, sp0, must< and_expr > > > {};
struct pipeline : seq< or_expr, star< sp0, pipe_op, sp0, must< send_expr > > > {};
struct expression : seq< pipeline > {};

// Patterns
struct hole_name : ident_body {};
struct type_name : ident_body {};
struct hole_brace_close : one<'}'> {};
struct hole_paren_close : one<')'> {};
struct block_hole : seq< one<'_'>, one<'{'>, sp0, must< hole_name >, sp0, must< hole_brace_close > > {};
struct type_constraint : seq< hole_name, sp0, field_colon, sp0, type_name, sp0, at< one<')'> > > {};
struct predicate_test : seq< expression > {};
struct predicate_hole : seq< one<'_'>, one<'('>, ws0, sor< type_constraint, must< predicate_test > >, ws0, must< hole_paren_close > > {};
struct value_hole : seq< one<'_'>, hole_name > {};
struct discard_hole : seq< one<'_'>, not_at< sor< ident_char, one<'(','{'> > > > {};
struct pattern_word : ident_body {};
struct pattern_token : sor< block_hole, predicate_hole, value_hole, discard_hole, number, string_lit, kw_true, kw_false, pattern_word > {};
struct pattern : seq< one<'['>, ws0, list< pattern_token, plus< ws_any > >, ws0, one<']'> > {};

// Statements
struct agent_name : ident_body {};
struct agent_body : if_must< one<'{'>, statement_list, block_close > {};
struct agent_def : if_must< kw_agent, sp1, agent_name, ws0, agent_body > {};
struct handler_body : if_must< one<'{'>, statement_list, block_close > {};
struct handler_def : seq< pattern, ws0, handler_body > {};
struct field_name : identifier {};
struct field_decl : seq< field_name, sp0, field_colon, sp0, must< type_name >, opt< sp0, assign_eq, sp0, must< expression > > > {};
struct assign_name : identifier {};
struct assignment : seq< assign_name, sp0, assign_eq, sp0, must< expression > > {};
struct expr_stmt : seq< expression > {};
struct statement : sor< agent_def, handler_def, field_decl, assignment, expr_stmt > {};

struct stmt_end : sor< seq< sp0, opt< comment_line >, sor< one<';'>, eol > >,
                       at< sp0, one<'}'> >,
                       at< sp0, opt< comment_line >, eof > > {};
struct skip : star< sor< blank, eol, comment_line, one<';'> > > {};
struct statement_list : seq< skip, star< statement, must< stmt_end >, skip > > {};

struct module_end : eof {};
struct module_rule : seq< statement_list, must< module_end > > {};
struct pattern_rule : seq< ws0, pattern, ws0, must< module_end > > {};
struct expression_rule : seq< ws0, expression, ws0, must< module_end > > {};

// Human-readable descriptions for rules that can fail under must<>.
template<typename Rule> inline constexpr const char* expected = nullptr;
template<> inline constexpr const char* expected<block_comment_close> = "'*/'";
template<> inline constexpr const char* expected<triple_body> = "string contents";
template<> inline constexpr const char* expected<triple_close> = "closing '\"\"\"'";
template<> inline constexpr const char* expected<dq_body> = "string contents";
template<> inline constexpr const char* expected<dq_close> = "closing '\"'";
template<> inline constexpr const char* expected<sq_body> = "string contents";
template<> inline constexpr const char* expected<sq_close> = "closing \"'\"";
template<> inline constexpr const char* expected<sp0> = "whitespace";
template<> inline constexpr const char* expected<sp1> = "whitespace";
template<> inline constexpr const char* expected<ws0> = "whitespace";
template<> inline constexpr const char* expected<embed_eol> = "newline after fence tags";
template<> inline constexpr const char* expected<embed_body> = "raw text";
template<> inline constexpr const char* expected<fence_close> = "closing '```'";
template<> inline constexpr const char* expected<expression> = "expression";
template<> inline constexpr const char* expected<paren_close> = "')'";
template<> inline constexpr const char* expected<statement_list> = "statements";
template<> inline constexpr const char* expected<block_close> = "'}'";
template<> inline constexpr const char* expected<list_close> = "']'";
template<> inline constexpr const char* expected<map_colon> = "':' after map key";
template<> inline constexpr const char* expected<map_close> = "'}' closing map literal";
template<> inline constexpr const char* expected<spawn_name> = "agent name after 'spawn'";
template<> inline constexpr const char* expected<unary> = "operand";
template<> inline constexpr const char* expected<mul_expr> = "operand";
template<> inline constexpr const char* expected<add_expr> = "operand";
template<> inline constexpr const char* expected<rel_expr> = "operand";
template<> inline constexpr const char* expected<eq_expr> = "operand";
template<> inline constexpr const char* expected<and_expr> = "operand";
template<> inline constexpr const char* expected<send_expr> = "message send after '|>'";
template<> inline constexpr const char* expected<hole_name> = "hole name";
template<> inline constexpr const char* expected<hole_brace_close> = "'}' closing block hole";
template<> inline constexpr const char* expected<hole_paren_close> = "')' closing predicate hole";
template<> inline constexpr const char* expected<predicate_test> = "predicate expression";
template<> inline constexpr const char* expected<agent_name> = "agent name";
template<> inline constexpr const char* expected<agent_body> = "'{' starting agent body";
template<> inline constexpr const char* expected<type_name> = "type name";
template<> inline constexpr const char* expected<operand> = "block or operand after '*'";
template<> inline constexpr const char* expected<stmt_end> = "end of statement";
template<> inline constexpr const char* expected<module_end> = "statement or end of input";

template<typename Rule>
struct control : normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...){
        if constexpr (expected<Rule> != nullptr) throw tao::pegtl::parse_error(expected<Rule>, in);
        else throw tao::pegtl::parse_error(std::string(demangle<Rule>()), in);
    }
};

template<typename Rule>
using selector = parse_tree::selector< Rule,
    parse_tree::store_content::on<
        agent_def, agent_name, agent_body, handler_def, handler_body, pattern,
        pattern_word, value_hole, block_hole, predicate_hole, discard_hole, hole_name,
        type_constraint, type_name, predicate_test,
        field_decl, field_name, assignment, assign_name, expr_stmt,
        pipeline, or_expr, and_expr, eq_expr, rel_expr, add_expr, mul_expr,
        or_op, and_op, eq_op, rel_op, add_op, mul_op,
        not_expr, block_call, send_expr, spawn_expr, spawn_name, paren_expr,
        block_lit, list_lit, map_lit, map_entry, map_key_word,
        int_lit, float_lit, dq_body, sq_body, triple_body,
        embedded_text, embed_tag, embed_body,
        kw_true, kw_false, kw_unit, kw_self, identifier > >;

} // namespace komrad::pegtl_front::grammar
