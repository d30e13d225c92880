#pragma once

/**
 * @file ConditionParser.hpp
 * @brief Condition expression parser
 *
 * Compiles expressions like "Any(AtPass(0), EveryNCalls(B, 2))" or
 * "AfterNCalls(A, 3) and not While(converged)" into Condition trees.
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/sched/Condition.hpp>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chronos {

// ============================================================================
// Predicate Registry
// ============================================================================

/**
 * @brief Named predicates available to While(name) / NWhile(name)
 */
class PredicateRegistry {
  public:
    using Predicate = std::function<bool()>;

    void Register(const std::string &name, Predicate predicate) {
        if (!predicate) {
            throw ConditionError("empty predicate registered as '" + name + "'");
        }
        predicates_[name] = std::move(predicate);
    }

    [[nodiscard]] bool Contains(const std::string &name) const {
        return predicates_.count(name) > 0;
    }

    /// @throws ConditionError if not registered
    [[nodiscard]] const Predicate &Get(const std::string &name) const {
        auto it = predicates_.find(name);
        if (it == predicates_.end()) {
            throw ConditionError("Unknown predicate '" + name + "'");
        }
        return it->second;
    }

    [[nodiscard]] std::vector<std::string> Names() const {
        std::vector<std::string> names;
        for (const auto &kv : predicates_) {
            names.push_back(kv.first);
        }
        return names;
    }

  private:
    std::map<std::string, Predicate> predicates_;
};

// ============================================================================
// Tokens
// ============================================================================

enum class TokenType {
    Integer,    // 0, 42
    Identifier, // EveryNCalls, stage.A, TRIAL

    And, // AND, and, &&
    Or,  // OR, or, ||
    Not, // NOT, not, !

    LeftParen,  // (
    RightParen, // )
    Comma,      // ,

    Eof
};

struct Token {
    TokenType type;
    std::string value;
    std::size_t position = 0;

    Token(TokenType t, std::string v, std::size_t pos = 0)
        : type(t), value(std::move(v)), position(pos) {}
};

// ============================================================================
// Tokenizer
// ============================================================================

class Tokenizer {
  public:
    explicit Tokenizer(std::string_view input) : input_(input), pos_(0) {}

    [[nodiscard]] std::vector<Token> Tokenize() {
        std::vector<Token> tokens;

        while (!AtEnd()) {
            SkipWhitespace();
            if (AtEnd())
                break;

            std::size_t start = pos_;
            char c = Peek();

            if (c == '&' && PeekNext() == '&') {
                Advance();
                Advance();
                tokens.emplace_back(TokenType::And, "&&", start);
            } else if (c == '|' && PeekNext() == '|') {
                Advance();
                Advance();
                tokens.emplace_back(TokenType::Or, "||", start);
            } else if (c == '!') {
                Advance();
                tokens.emplace_back(TokenType::Not, "!", start);
            } else if (c == '(') {
                Advance();
                tokens.emplace_back(TokenType::LeftParen, "(", start);
            } else if (c == ')') {
                Advance();
                tokens.emplace_back(TokenType::RightParen, ")", start);
            } else if (c == ',') {
                Advance();
                tokens.emplace_back(TokenType::Comma, ",", start);
            } else if (IsDigit(c)) {
                tokens.push_back(ScanInteger());
            } else if (IsAlpha(c) || c == '_') {
                tokens.push_back(ScanIdentifier());
            } else {
                throw ConditionError("Unexpected character '" + std::string(1, c) +
                                     "' at position " + std::to_string(pos_));
            }
        }

        tokens.emplace_back(TokenType::Eof, "", pos_);
        return tokens;
    }

  private:
    std::string_view input_;
    std::size_t pos_;

    [[nodiscard]] bool AtEnd() const { return pos_ >= input_.size(); }

    [[nodiscard]] char Peek() const { return AtEnd() ? '\0' : input_[pos_]; }

    [[nodiscard]] char PeekNext() const {
        return (pos_ + 1 >= input_.size()) ? '\0' : input_[pos_ + 1];
    }

    char Advance() { return input_[pos_++]; }

    static bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
    static bool IsAlpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
    static bool IsAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

    void SkipWhitespace() {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
            Advance();
        }
    }

    [[nodiscard]] Token ScanInteger() {
        std::size_t start = pos_;
        std::string value;
        while (!AtEnd() && IsDigit(Peek())) {
            value += Advance();
        }
        if (IsAlpha(Peek()) || Peek() == '_' || Peek() == '.') {
            throw ConditionError("Malformed number at position " + std::to_string(start));
        }
        return Token(TokenType::Integer, value, start);
    }

    [[nodiscard]] Token ScanIdentifier() {
        std::size_t start = pos_;
        std::string value;

        while (!AtEnd() && (IsAlnum(Peek()) || Peek() == '_' || Peek() == '.')) {
            value += Advance();
        }

        auto keyword = KeywordType(value);
        return Token(keyword.value_or(TokenType::Identifier), value, start);
    }

  public:
    /// AND, OR and NOT (upper or lower case) are operators, never names
    [[nodiscard]] static std::optional<TokenType> KeywordType(const std::string &word) {
        if (word == "AND" || word == "and") {
            return TokenType::And;
        }
        if (word == "OR" || word == "or") {
            return TokenType::Or;
        }
        if (word == "NOT" || word == "not") {
            return TokenType::Not;
        }
        return std::nullopt;
    }
};

// ============================================================================
// Expression Tree
// ============================================================================

/**
 * @brief Untyped parse tree; arguments are interpreted per function
 */
struct ConditionExpr {
    enum class Kind {
        Integer, ///< Literal
        Name,    ///< Bare identifier (node, scale, predicate, or zero-argument call)
        Call,    ///< Identifier '(' args ')'
        And,     ///< args joined by AND
        Or,      ///< args joined by OR
        Not      ///< args[0] negated
    };

    Kind kind = Kind::Name;
    std::string text;
    std::size_t value = 0;
    std::vector<ConditionExpr> args;
    std::size_t position = 0;
};

// ============================================================================
// Parser (Recursive Descent)
// ============================================================================

/**
 * @brief Parser for condition expressions
 *
 * Grammar:
 *   expression  -> or_expr
 *   or_expr     -> and_expr ((OR | '||') and_expr)*
 *   and_expr    -> not_expr ((AND | '&&') not_expr)*
 *   not_expr    -> (NOT | '!') not_expr | primary
 *   primary     -> '(' expression ')' | call | Integer
 *   call        -> Identifier [ '(' [ expression (',' expression)* ] ')' ]
 *
 * Function names match the factories in chronos::conditions. Time scale
 * arguments are TIME_STEP, PASS, TRIAL, RUN or LIFE. A node named after an
 * operator keyword (see Tokenizer::KeywordType) cannot be referenced.
 * Nesting of parentheses, NOT and call arguments is capped at
 * kMaxNestingDepth.
 */
class ConditionParser {
  public:
    static constexpr std::size_t kMaxNestingDepth = 128;

    ConditionParser() = default;
    explicit ConditionParser(const PredicateRegistry &predicates) : predicates_(&predicates) {}

    /**
     * @brief Parse and compile a condition string
     *
     * @throws ConditionError on parse failure, unknown function, wrong
     *         arguments, or unknown predicate
     */
    [[nodiscard]] ConditionPtr Parse(const std::string &condition) {
        Tokenizer tokenizer(condition);
        tokens_ = tokenizer.Tokenize();
        current_ = 0;
        depth_ = 0;

        if (IsAtEnd()) {
            throw ConditionError("Empty condition expression");
        }

        ConditionExpr root = ParseOrExpr();

        if (!IsAtEnd()) {
            throw ConditionError("Unexpected token '" + Peek().value + "' at position " +
                                 std::to_string(Peek().position));
        }

        return Compile(root);
    }

    /// Parse a standalone time scale keyword
    [[nodiscard]] static std::optional<TimeScale> ScaleKeyword(const std::string &text) {
        for (auto scale : kAllTimeScales) {
            if (text == ToString(scale)) {
                return scale;
            }
        }
        return std::nullopt;
    }

  private:
    const PredicateRegistry *predicates_ = nullptr;
    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    std::size_t depth_ = 0;

    class NestingGuard {
      public:
        NestingGuard(ConditionParser &parser, std::size_t position) : parser_(parser) {
            if (parser_.depth_ >= kMaxNestingDepth) {
                throw ConditionError("Expression nested deeper than " +
                                     std::to_string(kMaxNestingDepth) + " levels at position " +
                                     std::to_string(position));
            }
            ++parser_.depth_;
        }
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard &) = delete;
        NestingGuard &operator=(const NestingGuard &) = delete;

      private:
        ConditionParser &parser_;
    };

    // === Token Helpers ===

    [[nodiscard]] const Token &Peek() const { return tokens_[current_]; }

    [[nodiscard]] const Token &Previous() const { return tokens_[current_ - 1]; }

    [[nodiscard]] bool IsAtEnd() const { return Peek().type == TokenType::Eof; }

    Token Advance() {
        if (!IsAtEnd())
            current_++;
        return Previous();
    }

    [[nodiscard]] bool Check(TokenType type) const {
        if (IsAtEnd())
            return false;
        return Peek().type == type;
    }

    bool Match(TokenType type) {
        if (Check(type)) {
            Advance();
            return true;
        }
        return false;
    }

    Token Consume(TokenType type, const std::string &message) {
        if (Check(type))
            return Advance();
        throw ConditionError(message + " at position " + std::to_string(Peek().position));
    }

    // === Grammar ===

    // or_expr -> and_expr (OR and_expr)*
    [[nodiscard]] ConditionExpr ParseOrExpr() {
        NestingGuard guard(*this, Peek().position);
        ConditionExpr left = ParseAndExpr();
        if (!Check(TokenType::Or)) {
            return left;
        }

        ConditionExpr node;
        node.kind = ConditionExpr::Kind::Or;
        node.position = left.position;
        node.args.push_back(std::move(left));
        while (Match(TokenType::Or)) {
            node.args.push_back(ParseAndExpr());
        }
        return node;
    }

    // and_expr -> not_expr (AND not_expr)*
    [[nodiscard]] ConditionExpr ParseAndExpr() {
        ConditionExpr left = ParseNotExpr();
        if (!Check(TokenType::And)) {
            return left;
        }

        ConditionExpr node;
        node.kind = ConditionExpr::Kind::And;
        node.position = left.position;
        node.args.push_back(std::move(left));
        while (Match(TokenType::And)) {
            node.args.push_back(ParseNotExpr());
        }
        return node;
    }

    // not_expr -> NOT not_expr | primary
    [[nodiscard]] ConditionExpr ParseNotExpr() {
        if (Match(TokenType::Not)) {
            NestingGuard guard(*this, Previous().position);
            ConditionExpr node;
            node.kind = ConditionExpr::Kind::Not;
            node.position = Previous().position;
            node.args.push_back(ParseNotExpr());
            return node;
        }
        return ParsePrimary();
    }

    // primary -> '(' expression ')' | call | Integer
    [[nodiscard]] ConditionExpr ParsePrimary() {
        if (Match(TokenType::LeftParen)) {
            ConditionExpr expr = ParseOrExpr();
            Consume(TokenType::RightParen, "Expected ')' after expression");
            return expr;
        }

        if (Match(TokenType::Integer)) {
            ConditionExpr node;
            node.kind = ConditionExpr::Kind::Integer;
            node.text = Previous().value;
            node.position = Previous().position;
            try {
                node.value = static_cast<std::size_t>(std::stoull(node.text));
            } catch (const std::out_of_range &) {
                throw ConditionError("Integer '" + node.text + "' out of range at position " +
                                     std::to_string(node.position));
            }
            return node;
        }

        return ParseCall();
    }

    // call -> Identifier [ '(' [ expression (',' expression)* ] ')' ]
    [[nodiscard]] ConditionExpr ParseCall() {
        Token name = Consume(TokenType::Identifier, "Expected condition or node name");

        ConditionExpr node;
        node.kind = ConditionExpr::Kind::Name;
        node.text = name.value;
        node.position = name.position;

        if (!Match(TokenType::LeftParen)) {
            return node;
        }

        node.kind = ConditionExpr::Kind::Call;
        if (!Check(TokenType::RightParen)) {
            do {
                node.args.push_back(ParseOrExpr());
            } while (Match(TokenType::Comma));
        }
        Consume(TokenType::RightParen, "Expected ')' after arguments of " + name.value);
        return node;
    }

    // === Compilation ===

    [[nodiscard]] static std::string At(const ConditionExpr &expr) {
        return " at position " + std::to_string(expr.position);
    }

    [[nodiscard]] ConditionPtr Compile(const ConditionExpr &expr) const {
        using Kind = ConditionExpr::Kind;
        switch (expr.kind) {
        case Kind::Integer:
            throw ConditionError("Expected a condition, got integer " + expr.text + At(expr));
        case Kind::And:
            return conditions::All(CompileAll(expr.args, 0));
        case Kind::Or:
            return conditions::Any(CompileAll(expr.args, 0));
        case Kind::Not:
            return conditions::Not(Compile(expr.args.front()));
        case Kind::Name:
        case Kind::Call:
            return CompileCall(expr);
        }
        throw ConditionError("Malformed expression" + At(expr));
    }

    [[nodiscard]] std::vector<ConditionPtr> CompileAll(const std::vector<ConditionExpr> &args,
                                                       std::size_t first) const {
        std::vector<ConditionPtr> out;
        for (std::size_t i = first; i < args.size(); ++i) {
            out.push_back(Compile(args[i]));
        }
        return out;
    }

    /// Function call or bare zero-argument function name
    [[nodiscard]] ConditionPtr CompileCall(const ConditionExpr &call) const {
        namespace c = conditions;
        const std::string &fn = call.text;
        const auto &args = call.args;

        // --- Generic ---
        if (fn == "Always") {
            ExpectArity(call, 0, 0);
            return c::Always();
        }
        if (fn == "Never") {
            ExpectArity(call, 0, 0);
            return c::Never();
        }
        if (fn == "While" || fn == "NWhile") {
            ExpectCall(call);
            ExpectArity(call, 1, 1);
            const std::string name = Name(args[0], "predicate name");
            if (predicates_ == nullptr || !predicates_->Contains(name)) {
                throw ConditionError("Unknown predicate '" + name + "'" + At(args[0]));
            }
            const auto &predicate = predicates_->Get(name);
            return fn == "While" ? c::While(predicate, name) : c::NWhile(predicate, name);
        }
        if (fn == "All") {
            return c::All(CompileAll(args, 0));
        }
        if (fn == "Any") {
            return c::Any(CompileAll(args, 0));
        }
        if (fn == "Not") {
            ExpectCall(call);
            ExpectArity(call, 1, 1);
            return c::Not(Compile(args[0]));
        }
        if (fn == "AtLeastN") {
            ExpectCall(call);
            ExpectArity(call, 1, SIZE_MAX);
            return c::AtLeastN(Integer(args[0]), CompileAll(args, 1));
        }

        // --- Clocks: (n [, scale]) ---
        if (fn == "BeforePass" || fn == "AtPass" || fn == "AfterPass" || fn == "AfterNPasses" ||
            fn == "EveryNPasses" || fn == "BeforeTrial" || fn == "AtTrial" ||
            fn == "AfterTrial" || fn == "AfterNTrials") {
            ExpectCall(call);
            ExpectArity(call, 1, 2);
            const std::size_t n = Integer(args[0]);
            const bool pass_family = fn.find("Pass") != std::string::npos;
            const TimeScale scale =
                args.size() > 1 ? Scale(args[1]) : (pass_family ? TimeScale::Trial : TimeScale::Run);
            if (fn == "BeforePass")
                return c::BeforePass(n, scale);
            if (fn == "AtPass")
                return c::AtPass(n, scale);
            if (fn == "AfterPass")
                return c::AfterPass(n, scale);
            if (fn == "AfterNPasses")
                return c::AfterNPasses(n, scale);
            if (fn == "EveryNPasses")
                return c::EveryNPasses(n, scale);
            if (fn == "BeforeTrial")
                return c::BeforeTrial(n, scale);
            if (fn == "AtTrial")
                return c::AtTrial(n, scale);
            if (fn == "AfterTrial")
                return c::AfterTrial(n, scale);
            return c::AfterNTrials(n, scale);
        }

        // --- Call counts: (node, n [, scale]) ---
        if (fn == "BeforeNCalls" || fn == "AtNCalls" || fn == "AfterCall" ||
            fn == "AfterNCalls") {
            ExpectCall(call);
            ExpectArity(call, 2, 3);
            const NodeId dep = Name(args[0], "node name");
            const std::size_t n = Integer(args[1]);
            const TimeScale scale = args.size() > 2 ? Scale(args[2]) : TimeScale::Trial;
            if (fn == "BeforeNCalls")
                return c::BeforeNCalls(dep, n, scale);
            if (fn == "AtNCalls")
                return c::AtNCalls(dep, n, scale);
            if (fn == "AfterCall")
                return c::AfterCall(dep, n, scale);
            return c::AfterNCalls(dep, n, scale);
        }
        if (fn == "AfterNCallsCombined") {
            // (node, node..., n [, scale])
            ExpectCall(call);
            ExpectArity(call, 2, SIZE_MAX);
            std::size_t end = args.size();
            TimeScale scale = TimeScale::Trial;
            if (IsScale(args.back())) {
                scale = Scale(args.back());
                --end;
            }
            if (end < 2) {
                throw ConditionError("AfterNCallsCombined expects nodes followed by a count" +
                                     At(call));
            }
            std::vector<NodeId> deps;
            for (std::size_t i = 0; i + 1 < end; ++i) {
                deps.push_back(Name(args[i], "node name"));
            }
            return c::AfterNCallsCombined(std::move(deps), Integer(args[end - 1]), scale);
        }
        if (fn == "EveryNCalls") {
            ExpectCall(call);
            ExpectArity(call, 2, 2);
            return c::EveryNCalls(Name(args[0], "node name"), Integer(args[1]));
        }

        // --- History ---
        if (fn == "JustRan") {
            ExpectCall(call);
            ExpectArity(call, 1, 1);
            return c::JustRan(Name(args[0], "node name"));
        }
        if (fn == "AllHaveRun") {
            // ([node...] [, scale])
            std::size_t end = args.size();
            TimeScale scale = TimeScale::Trial;
            if (!args.empty() && IsScale(args.back())) {
                scale = Scale(args.back());
                --end;
            }
            return c::AllHaveRun(Names(args, end), scale);
        }

        // --- Finished state ---
        if (fn == "WhenFinished") {
            ExpectCall(call);
            ExpectArity(call, 1, 1);
            return c::WhenFinished(Name(args[0], "node name"));
        }
        if (fn == "WhenFinishedAny") {
            return c::WhenFinishedAny(Names(args, args.size()));
        }
        if (fn == "WhenFinishedAll") {
            return c::WhenFinishedAll(Names(args, args.size()));
        }

        throw ConditionError("Unknown condition '" + fn + "'" + At(call));
    }

    // === Argument Helpers ===

    static void ExpectCall(const ConditionExpr &call) {
        if (call.kind != ConditionExpr::Kind::Call) {
            throw ConditionError("'" + call.text + "' requires arguments" + At(call));
        }
    }

    static void ExpectArity(const ConditionExpr &call, std::size_t min, std::size_t max) {
        const std::size_t n = call.args.size();
        if (n < min || n > max) {
            std::string expected = std::to_string(min);
            if (max != min) {
                expected += max == SIZE_MAX ? " or more" : " to " + std::to_string(max);
            }
            throw ConditionError(call.text + " expects " + expected + " argument(s), got " +
                                 std::to_string(n) + At(call));
        }
    }

    [[nodiscard]] static std::size_t Integer(const ConditionExpr &arg) {
        if (arg.kind != ConditionExpr::Kind::Integer) {
            throw ConditionError("Expected integer" + At(arg));
        }
        return arg.value;
    }

    [[nodiscard]] static std::string Name(const ConditionExpr &arg, const std::string &what) {
        if (arg.kind != ConditionExpr::Kind::Name) {
            throw ConditionError("Expected " + what + At(arg));
        }
        return arg.text;
    }

    [[nodiscard]] static std::vector<NodeId> Names(const std::vector<ConditionExpr> &args,
                                                   std::size_t end) {
        std::vector<NodeId> names;
        for (std::size_t i = 0; i < end; ++i) {
            names.push_back(Name(args[i], "node name"));
        }
        return names;
    }

    [[nodiscard]] static bool IsScale(const ConditionExpr &arg) {
        return arg.kind == ConditionExpr::Kind::Name && ScaleKeyword(arg.text).has_value();
    }

    [[nodiscard]] static TimeScale Scale(const ConditionExpr &arg) {
        if (arg.kind == ConditionExpr::Kind::Name) {
            if (auto scale = ScaleKeyword(arg.text)) {
                return *scale;
            }
        }
        throw ConditionError("Expected time scale (TIME_STEP, PASS, TRIAL, RUN, LIFE)" + At(arg));
    }
};

} // namespace chronos
