// =============================================================================
// Kuzur Parser Tests
// =============================================================================
// Tests for the Kuzur lexer + parser pipeline.
// No external dependencies — minimal test framework included.
// =============================================================================

#include "../src/lexer/lexer.hpp"
#include "../src/parser/parser.hpp"
#include "../src/lib/errors/error.hpp"
#include <iostream>
#include <string>
#include <functional>
#include <sstream>

using namespace kuzur;

// ---- ostream support for TokenType (used by XASSERT_EQ) --------------------

inline std::ostream &operator<<(std::ostream &os, TokenType t)
{
    return os << tokenTypeToString(t);
}

// ---- Minimal test framework ------------------------------------------------

static int g_passed = 0;
static int g_failed = 0;

#define XASSERT(cond)                                                      \
    do                                                                     \
    {                                                                      \
        if (!(cond))                                                       \
        {                                                                  \
            std::ostringstream os;                                         \
            os << "Assertion failed: " #cond " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                            \
        }                                                                  \
    } while (0)

#define XASSERT_EQ(a, b)                                      \
    do                                                        \
    {                                                         \
        if ((a) != (b))                                       \
        {                                                     \
            std::ostringstream os;                            \
            os << "Expected '" << (b) << "' but got '" << (a) \
               << "' (line " << __LINE__ << ")";              \
            throw std::runtime_error(os.str());               \
        }                                                     \
    } while (0)

static void runTest(const std::string &name, std::function<void()> fn)
{
    try
    {
        fn();
        std::cout << "  \033[32mPASS\033[0m: " << name << "\n";
        g_passed++;
    }
    catch (const std::exception &e)
    {
        std::cout << "  \033[31mFAIL\033[0m: " << name << "\n        " << e.what() << "\n";
        g_failed++;
    }
}

// ---- Helpers ----------------------------------------------------------------

static std::vector<Token> lex(const std::string &source)
{
    Lexer lexer(source);
    return lexer.tokenize();
}

static Program parseSource(const std::string &source)
{
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    return parser.parse();
}

template <typename T>
T *firstStmt(Program &prog)
{
    XASSERT(prog.statements.size() >= 1);
    auto *p = dynamic_cast<T *>(prog.statements[0].get());
    XASSERT(p != nullptr);
    return p;
}

template <typename T>
T *asExpr(Expr *e)
{
    auto *p = dynamic_cast<T *>(e);
    XASSERT(p != nullptr);
    return p;
}

template <typename ExcType>
static bool expectLexError(const std::string &source)
{
    try
    {
        lex(source);
        return false;
    }
    catch (const ExcType &)
    {
        return true;
    }
}

static ParseError expectParseError(const std::string &source)
{
    try
    {
        parseSource(source);
    }
    catch (const ParseError &e)
    {
        return e;
    }
    throw std::runtime_error("expected a ParseError for: " + source);
}

// =============================================================================
// LEXER
// =============================================================================

void test_lexer_simple_tokens()
{
    auto tokens = lex("x = 10");
    XASSERT_EQ(tokens.size(), (size_t)4); // IDENT EQUAL NUMBER EOF
    XASSERT_EQ(tokens[0].type, TokenType::IDENTIFIER);
    XASSERT_EQ(tokens[0].value, std::string("x"));
    XASSERT_EQ(tokens[1].type, TokenType::EQUAL);
    XASSERT_EQ(tokens[2].type, TokenType::NUMBER);
    XASSERT_EQ(tokens[2].value, std::string("10"));
    XASSERT_EQ(tokens[3].type, TokenType::EOF_TOKEN);
}

void test_lexer_all_keywords()
{
    auto tokens = lex("if elif else while for do func return break continue true false");
    XASSERT_EQ(tokens[0].type, TokenType::IF);
    XASSERT_EQ(tokens[1].type, TokenType::ELIF);
    XASSERT_EQ(tokens[2].type, TokenType::ELSE);
    XASSERT_EQ(tokens[3].type, TokenType::WHILE);
    XASSERT_EQ(tokens[4].type, TokenType::FOR);
    XASSERT_EQ(tokens[5].type, TokenType::DO);
    XASSERT_EQ(tokens[6].type, TokenType::FUNC);
    XASSERT_EQ(tokens[7].type, TokenType::RETURN);
    XASSERT_EQ(tokens[8].type, TokenType::BREAK);
    XASSERT_EQ(tokens[9].type, TokenType::CONTINUE);
    XASSERT_EQ(tokens[10].type, TokenType::TRUE_KW);
    XASSERT_EQ(tokens[11].type, TokenType::FALSE_KW);
    XASSERT_EQ(tokens[12].type, TokenType::EOF_TOKEN);
}

void test_lexer_keyword_prefix_is_identifier()
{
    auto tokens = lex("iffy returned _do");
    XASSERT_EQ(tokens[0].type, TokenType::IDENTIFIER);
    XASSERT_EQ(tokens[1].type, TokenType::IDENTIFIER);
    XASSERT_EQ(tokens[2].type, TokenType::IDENTIFIER);
}

void test_lexer_two_char_operators()
{
    auto tokens = lex("== != <= >= && || < > = !");
    XASSERT_EQ(tokens[0].type, TokenType::EQUAL_EQUAL);
    XASSERT_EQ(tokens[1].type, TokenType::BANG_EQUAL);
    XASSERT_EQ(tokens[2].type, TokenType::LESS_EQUAL);
    XASSERT_EQ(tokens[3].type, TokenType::GREATER_EQUAL);
    XASSERT_EQ(tokens[4].type, TokenType::AMP_AMP);
    XASSERT_EQ(tokens[5].type, TokenType::PIPE_PIPE);
    XASSERT_EQ(tokens[6].type, TokenType::LESS);
    XASSERT_EQ(tokens[7].type, TokenType::GREATER);
    XASSERT_EQ(tokens[8].type, TokenType::EQUAL);
    XASSERT_EQ(tokens[9].type, TokenType::BANG);
}

void test_lexer_delimiters()
{
    auto tokens = lex("( ) { } , ; + - * / %");
    XASSERT_EQ(tokens[0].type, TokenType::LPAREN);
    XASSERT_EQ(tokens[1].type, TokenType::RPAREN);
    XASSERT_EQ(tokens[2].type, TokenType::LBRACE);
    XASSERT_EQ(tokens[3].type, TokenType::RBRACE);
    XASSERT_EQ(tokens[4].type, TokenType::COMMA);
    XASSERT_EQ(tokens[5].type, TokenType::SEMICOLON);
    XASSERT_EQ(tokens[6].type, TokenType::PLUS);
    XASSERT_EQ(tokens[7].type, TokenType::MINUS);
    XASSERT_EQ(tokens[8].type, TokenType::STAR);
    XASSERT_EQ(tokens[9].type, TokenType::SLASH);
    XASSERT_EQ(tokens[10].type, TokenType::PERCENT);
}

void test_lexer_decimal_number()
{
    auto tokens = lex("3.14 42");
    XASSERT_EQ(tokens[0].type, TokenType::NUMBER);
    XASSERT_EQ(tokens[0].value, std::string("3.14"));
    XASSERT_EQ(tokens[1].value, std::string("42"));
}

void test_lexer_strings_are_raw()
{
    auto tokens = lex("\"a\\nb\" 'single'");
    XASSERT_EQ(tokens[0].type, TokenType::STRING);
    XASSERT_EQ(tokens[0].value, std::string("a\\nb"));
    XASSERT_EQ(tokens[1].type, TokenType::STRING);
    XASSERT_EQ(tokens[1].value, std::string("single"));
}

void test_lexer_comments_skipped()
{
    auto tokens = lex("// header\nx // trailing\n");
    XASSERT_EQ(tokens.size(), (size_t)2);
    XASSERT_EQ(tokens[0].value, std::string("x"));
    XASSERT_EQ(tokens[0].line, 2);
}

void test_lexer_positions()
{
    auto tokens = lex("a = 1\n  print(a)");
    XASSERT_EQ(tokens[0].line, 1);
    XASSERT_EQ(tokens[0].column, 1);
    XASSERT_EQ(tokens[2].column, 5);
    XASSERT_EQ(tokens[3].value, std::string("print"));
    XASSERT_EQ(tokens[3].line, 2);
    XASSERT_EQ(tokens[3].column, 3);
}

void test_lexer_unterminated_string()
{
    XASSERT(expectLexError<LexError>("x = \"abc"));
    XASSERT(expectLexError<LexError>("x = \"abc\ny\""));
}

void test_lexer_unexpected_character()
{
    try
    {
        lex("x = 1\ny = @");
        throw std::runtime_error("expected LexError");
    }
    catch (const LexError &e)
    {
        XASSERT_EQ(e.line(), 2);
        XASSERT_EQ(e.column(), 5);
        XASSERT(std::string(e.what()).find("unexpected character '@'") != std::string::npos);
    }
}

void test_lexer_single_ampersand_rejected()
{
    XASSERT(expectLexError<LexError>("a & b"));
    XASSERT(expectLexError<LexError>("a | b"));
}

// =============================================================================
// PARSER: expressions
// =============================================================================

void test_parse_assignment()
{
    auto prog = parseSource("x = 42");
    auto *assign = firstStmt<VarAssign>(prog);
    XASSERT_EQ(assign->name, std::string("x"));
    auto *num = asExpr<NumberLiteral>(assign->value.get());
    XASSERT_EQ(num->value, 42.0);
}

void test_parse_precedence()
{
    // 2 + 3 * 4 → 2 + (3 * 4)
    auto prog = parseSource("2 + 3 * 4");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *add = asExpr<BinaryExpr>(stmt->expr.get());
    XASSERT_EQ(add->op, std::string("+"));
    auto *mul = asExpr<BinaryExpr>(add->right.get());
    XASSERT_EQ(mul->op, std::string("*"));
}

void test_parse_left_associative()
{
    // 10 - 4 - 3 → (10 - 4) - 3
    auto prog = parseSource("10 - 4 - 3");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *outer = asExpr<BinaryExpr>(stmt->expr.get());
    auto *inner = asExpr<BinaryExpr>(outer->left.get());
    XASSERT_EQ(inner->op, std::string("-"));
    XASSERT_EQ(asExpr<NumberLiteral>(outer->right.get())->value, 3.0);
}

void test_parse_logical_precedence()
{
    // a || b && c → a || (b && c)
    auto prog = parseSource("a || b && c");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *orExpr = asExpr<LogicalExpr>(stmt->expr.get());
    XASSERT_EQ(orExpr->op, std::string("||"));
    auto *andExpr = asExpr<LogicalExpr>(orExpr->right.get());
    XASSERT_EQ(andExpr->op, std::string("&&"));
}

void test_parse_comparison_below_additive()
{
    auto prog = parseSource("x + 1 > y == true");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *eq = asExpr<BinaryExpr>(stmt->expr.get());
    XASSERT_EQ(eq->op, std::string("=="));
    auto *gt = asExpr<BinaryExpr>(eq->left.get());
    XASSERT_EQ(gt->op, std::string(">"));
    asExpr<BinaryExpr>(gt->left.get());
    asExpr<BoolLiteral>(eq->right.get());
}

void test_parse_unary_nesting()
{
    auto prog = parseSource("!!x");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *outer = asExpr<UnaryExpr>(stmt->expr.get());
    auto *inner = asExpr<UnaryExpr>(outer->operand.get());
    XASSERT_EQ(inner->op, std::string("!"));
    asExpr<Identifier>(inner->operand.get());
}

void test_parse_grouping()
{
    auto prog = parseSource("(2 + 3) * 4");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *mul = asExpr<BinaryExpr>(stmt->expr.get());
    XASSERT_EQ(mul->op, std::string("*"));
    asExpr<BinaryExpr>(mul->left.get());
}

void test_parse_call_args()
{
    auto prog = parseSource("print(\"a\", 1 + 2, f())");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *call = asExpr<CallExpr>(stmt->expr.get());
    XASSERT_EQ(call->callee, std::string("print"));
    XASSERT_EQ(call->args.size(), (size_t)3);
    asExpr<StringLiteral>(call->args[0].get());
    asExpr<BinaryExpr>(call->args[1].get());
    asExpr<CallExpr>(call->args[2].get());
}

void test_parse_assignment_expression()
{
    auto prog = parseSource("print(x = 3)");
    auto *stmt = firstStmt<ExprStmt>(prog);
    auto *call = asExpr<CallExpr>(stmt->expr.get());
    auto *assign = asExpr<AssignExpr>(call->args[0].get());
    XASSERT_EQ(assign->name, std::string("x"));
}

// =============================================================================
// PARSER: statements
// =============================================================================

void test_parse_if_elif_else()
{
    auto prog = parseSource("if (x > 1) { a = 1 } elif (x > 0) { a = 2 } elif (x == 0) { a = 3 } else { a = 4 }");
    auto *ifs = firstStmt<IfStmt>(prog);
    asExpr<BinaryExpr>(ifs->condition.get());
    XASSERT_EQ(ifs->thenBlock->statements.size(), (size_t)1);
    XASSERT_EQ(ifs->elifs.size(), (size_t)2);
    XASSERT(ifs->elseBlock != nullptr);
}

void test_parse_if_without_else()
{
    auto prog = parseSource("if (true) { }");
    auto *ifs = firstStmt<IfStmt>(prog);
    XASSERT(ifs->elifs.empty());
    XASSERT(ifs->elseBlock == nullptr);
    XASSERT(ifs->thenBlock->statements.empty());
}

void test_parse_while()
{
    auto prog = parseSource("while (i < 10) { i = i + 1 }");
    auto *w = firstStmt<WhileStmt>(prog);
    asExpr<BinaryExpr>(w->condition.get());
    XASSERT_EQ(w->body->statements.size(), (size_t)1);
}

void test_parse_do_while()
{
    auto prog = parseSource("do { print(x) } while (x < 5)");
    auto *dw = firstStmt<DoWhileStmt>(prog);
    XASSERT_EQ(dw->body->statements.size(), (size_t)1);
    asExpr<BinaryExpr>(dw->condition.get());
}

void test_parse_for()
{
    auto prog = parseSource("for i = 1; 10 { print(i) }");
    auto *f = firstStmt<ForStmt>(prog);
    XASSERT_EQ(f->varName, std::string("i"));
    XASSERT_EQ(asExpr<NumberLiteral>(f->start.get())->value, 1.0);
    XASSERT_EQ(asExpr<NumberLiteral>(f->end.get())->value, 10.0);
}

void test_parse_for_parenthesized()
{
    auto prog = parseSource("for (i = 0; n - 1) { }");
    auto *f = firstStmt<ForStmt>(prog);
    asExpr<BinaryExpr>(f->end.get());
}

void test_parse_func_decl()
{
    auto prog = parseSource("func add(a, b) { return a + b }");
    auto *fn = firstStmt<FuncDecl>(prog);
    XASSERT_EQ(fn->name, std::string("add"));
    XASSERT_EQ(fn->params.size(), (size_t)2);
    XASSERT_EQ(fn->params[1], std::string("b"));
    auto *ret = dynamic_cast<ReturnStmt *>(fn->body->statements[0].get());
    XASSERT(ret != nullptr);
    asExpr<BinaryExpr>(ret->value.get());
}

void test_parse_func_no_params()
{
    auto prog = parseSource("func hello() { print(\"hi\") }");
    auto *fn = firstStmt<FuncDecl>(prog);
    XASSERT(fn->params.empty());
}

void test_parse_return_without_value()
{
    auto prog = parseSource("func f() { return }");
    auto *fn = firstStmt<FuncDecl>(prog);
    auto *ret = dynamic_cast<ReturnStmt *>(fn->body->statements[0].get());
    XASSERT(ret != nullptr);
    XASSERT(ret->value == nullptr);
}

void test_parse_return_value_must_share_line()
{
    auto prog = parseSource("func f() {\n  return\n  x\n}");
    auto *fn = firstStmt<FuncDecl>(prog);
    XASSERT_EQ(fn->body->statements.size(), (size_t)2);
    auto *ret = dynamic_cast<ReturnStmt *>(fn->body->statements[0].get());
    XASSERT(ret != nullptr);
    XASSERT(ret->value == nullptr);
}

void test_parse_break_continue()
{
    auto prog = parseSource("while (true) { break; continue }");
    auto *w = firstStmt<WhileStmt>(prog);
    XASSERT_EQ(w->body->statements.size(), (size_t)2);
    XASSERT(dynamic_cast<BreakStmt *>(w->body->statements[0].get()) != nullptr);
    XASSERT(dynamic_cast<ContinueStmt *>(w->body->statements[1].get()) != nullptr);
}

void test_parse_semicolons_and_newlines()
{
    auto prog = parseSource("a = 1; b = 2;\n;c = 3\nprint(a)");
    XASSERT_EQ(prog.statements.size(), (size_t)4);
}

void test_parse_statement_positions()
{
    auto prog = parseSource("\n\n  x = 1");
    auto *assign = firstStmt<VarAssign>(prog);
    XASSERT_EQ(assign->line, 3);
    XASSERT_EQ(assign->column, 3);
}

void test_parse_newline_ends_expression()
{
    auto prog = parseSource("x = 10\n-5\nprint(x)");
    XASSERT_EQ(prog.statements.size(), (size_t)3);
    auto *assign = firstStmt<VarAssign>(prog);
    XASSERT_EQ(asExpr<NumberLiteral>(assign->value.get())->value, 10.0);
    auto *stmt = dynamic_cast<ExprStmt *>(prog.statements[1].get());
    XASSERT(stmt != nullptr);
    auto *neg = asExpr<UnaryExpr>(stmt->expr.get());
    XASSERT_EQ(neg->op, std::string("-"));
    XASSERT_EQ(neg->line, 2);
}

void test_parse_newline_before_binary_operators()
{
    auto err = expectParseError("a = b\n* 2");
    XASSERT_EQ(err.line(), 2);
    XASSERT_EQ(err.found(), std::string("'*'"));

    err = expectParseError("ok = x\n&& y");
    XASSERT_EQ(err.line(), 2);
    XASSERT_EQ(err.found(), std::string("'&&'"));
}

void test_parse_operator_at_line_end_continues()
{
    auto prog = parseSource("total = 1 +\n  2 *\n  3");
    XASSERT_EQ(prog.statements.size(), (size_t)1);
    auto *assign = firstStmt<VarAssign>(prog);
    auto *add = asExpr<BinaryExpr>(assign->value.get());
    XASSERT_EQ(add->op, std::string("+"));
    XASSERT_EQ(asExpr<BinaryExpr>(add->right.get())->op, std::string("*"));
}

void test_parse_moderate_nesting()
{
    std::string src = "print(" + std::string(100, '(') + "1" + std::string(100, ')') + ")";
    auto prog = parseSource(src);
    XASSERT_EQ(prog.statements.size(), (size_t)1);
}

// =============================================================================
// PARSER: errors
// =============================================================================

void test_parse_error_if_without_parens()
{
    auto err = expectParseError("x = 12\nif x > 10 {\n  print(x)\n}");
    XASSERT_EQ(err.line(), 2);
    XASSERT_EQ(err.expected(), std::string("'(' after 'if'"));
    XASSERT_EQ(err.found(), std::string("'x'"));
}

void test_parse_error_missing_close_brace()
{
    auto err = expectParseError("while (true) {\n  x = 1\n");
    XASSERT_EQ(err.found(), std::string("end of input"));
    XASSERT(err.expected().find("'}'") != std::string::npos);
}

void test_parse_error_missing_expression()
{
    auto err = expectParseError("x = * 2");
    XASSERT_EQ(err.expected(), std::string("an expression"));
    XASSERT_EQ(err.found(), std::string("'*'"));
}

void test_parse_error_missing_rparen_in_call()
{
    auto err = expectParseError("print(1, 2");
    XASSERT_EQ(err.found(), std::string("end of input"));
}

void test_parse_error_do_without_while()
{
    auto err = expectParseError("do { x = 1 } print(x)");
    XASSERT_EQ(err.expected(), std::string("'while' after do block"));
}

void test_parse_error_duplicate_param()
{
    auto err = expectParseError("func f(a, a) { }");
    XASSERT(err.found().find("duplicate 'a'") != std::string::npos);
}

void test_parse_error_found_describes_literals()
{
    auto err = expectParseError("if (x) \"oops\"");
    XASSERT_EQ(err.found(), std::string("string \"oops\""));
}

void test_parse_error_nesting_too_deep()
{
    std::string parens = "print(" + std::string(300, '(') + "1" + std::string(300, ')') + ")";
    auto err = expectParseError(parens);
    XASSERT_EQ(err.expected(), std::string("shallower nesting"));
    XASSERT_EQ(err.line(), 1);

    std::string huge = std::string(100000, '(') + "1" + std::string(100000, ')');
    XASSERT_EQ(expectParseError(huge).expected(), std::string("shallower nesting"));
}

void test_parse_error_prefix_chain_too_deep()
{
    std::string negs = "x = " + std::string(5000, '-') + "1";
    XASSERT_EQ(expectParseError(negs).expected(), std::string("shallower nesting"));
    std::string nots = "x = " + std::string(5000, '!') + "true";
    XASSERT_EQ(expectParseError(nots).expected(), std::string("shallower nesting"));
}

void test_parse_error_blocks_too_deep()
{
    std::string src;
    for (int i = 0; i < 300; i++)
        src += "if (true) {\n";
    src += "x = 1\n";
    for (int i = 0; i < 300; i++)
        src += "}\n";
    auto err = expectParseError(src);
    XASSERT_EQ(err.expected(), std::string("shallower nesting"));
    XASSERT(err.line() > 200);
}

// =============================================================================
// Main
// =============================================================================

int main()
{
    std::cout << "\n===== Lexer =====\n";
    runTest("lexer: simple tokens", test_lexer_simple_tokens);
    runTest("lexer: all keywords", test_lexer_all_keywords);
    runTest("lexer: keyword prefix is identifier", test_lexer_keyword_prefix_is_identifier);
    runTest("lexer: two-char operators", test_lexer_two_char_operators);
    runTest("lexer: delimiters", test_lexer_delimiters);
    runTest("lexer: decimal number", test_lexer_decimal_number);
    runTest("lexer: raw strings", test_lexer_strings_are_raw);
    runTest("lexer: comments skipped", test_lexer_comments_skipped);
    runTest("lexer: token positions", test_lexer_positions);
    runTest("lexer: unterminated string", test_lexer_unterminated_string);
    runTest("lexer: unexpected character", test_lexer_unexpected_character);
    runTest("lexer: single & and | rejected", test_lexer_single_ampersand_rejected);

    std::cout << "\n===== Parser: Expressions =====\n";
    runTest("parse: assignment", test_parse_assignment);
    runTest("parse: precedence", test_parse_precedence);
    runTest("parse: left associative", test_parse_left_associative);
    runTest("parse: logical precedence", test_parse_logical_precedence);
    runTest("parse: comparison below additive", test_parse_comparison_below_additive);
    runTest("parse: unary nesting", test_parse_unary_nesting);
    runTest("parse: grouping", test_parse_grouping);
    runTest("parse: call args", test_parse_call_args);
    runTest("parse: assignment expression", test_parse_assignment_expression);

    std::cout << "\n===== Parser: Statements =====\n";
    runTest("parse: if/elif/else", test_parse_if_elif_else);
    runTest("parse: if without else", test_parse_if_without_else);
    runTest("parse: while", test_parse_while);
    runTest("parse: do-while", test_parse_do_while);
    runTest("parse: for", test_parse_for);
    runTest("parse: for parenthesized", test_parse_for_parenthesized);
    runTest("parse: func decl", test_parse_func_decl);
    runTest("parse: func no params", test_parse_func_no_params);
    runTest("parse: return without value", test_parse_return_without_value);
    runTest("parse: return value on same line", test_parse_return_value_must_share_line);
    runTest("parse: break/continue", test_parse_break_continue);
    runTest("parse: semicolons and newlines", test_parse_semicolons_and_newlines);
    runTest("parse: statement positions", test_parse_statement_positions);
    runTest("parse: newline ends expression", test_parse_newline_ends_expression);
    runTest("parse: newline before binary operator", test_parse_newline_before_binary_operators);
    runTest("parse: operator at line end continues", test_parse_operator_at_line_end_continues);
    runTest("parse: moderate nesting", test_parse_moderate_nesting);

    std::cout << "\n===== Parser: Errors =====\n";
    runTest("error: if without parens", test_parse_error_if_without_parens);
    runTest("error: missing close brace", test_parse_error_missing_close_brace);
    runTest("error: missing expression", test_parse_error_missing_expression);
    runTest("error: missing ) in call", test_parse_error_missing_rparen_in_call);
    runTest("error: do without while", test_parse_error_do_without_while);
    runTest("error: duplicate parameter", test_parse_error_duplicate_param);
    runTest("error: found describes literals", test_parse_error_found_describes_literals);
    runTest("error: nesting too deep", test_parse_error_nesting_too_deep);
    runTest("error: prefix chain too deep", test_parse_error_prefix_chain_too_deep);
    runTest("error: blocks too deep", test_parse_error_blocks_too_deep);

    // Summary
    std::cout << "\n============================================\n";
    std::cout << "  Total: " << (g_passed + g_failed)
              << "  |  \033[32mPassed: " << g_passed
              << "\033[0m  |  \033[31mFailed: " << g_failed << "\033[0m\n";
    std::cout << "============================================\n\n";

    return g_failed > 0 ? 1 : 0;
}
