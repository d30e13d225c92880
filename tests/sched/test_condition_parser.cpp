#include <gtest/gtest.h>
#include <chronos/sched/ConditionParser.hpp>
#include <chronos/sched/SchedulerState.hpp>

#include <string>

using namespace chronos;

// ============================================================================
// Tokenizer Tests
// ============================================================================

TEST(Tokenizer, CallWithArguments) {
    Tokenizer tokenizer("EveryNCalls(A, 2)");
    auto tokens = tokenizer.Tokenize();

    ASSERT_EQ(tokens.size(), 7u); // name ( A , 2 ) EOF
    EXPECT_EQ(tokens[0].type, TokenType::Identifier);
    EXPECT_EQ(tokens[0].value, "EveryNCalls");
    EXPECT_EQ(tokens[1].type, TokenType::LeftParen);
    EXPECT_EQ(tokens[2].type, TokenType::Identifier);
    EXPECT_EQ(tokens[3].type, TokenType::Comma);
    EXPECT_EQ(tokens[4].type, TokenType::Integer);
    EXPECT_EQ(tokens[4].value, "2");
    EXPECT_EQ(tokens[4].position, 15u);
    EXPECT_EQ(tokens[5].type, TokenType::RightParen);
    EXPECT_EQ(tokens[6].type, TokenType::Eof);
}

TEST(Tokenizer, BooleanKeywords) {
    Tokenizer tokenizer("a AND b OR NOT c and d or not e");
    auto tokens = tokenizer.Tokenize();

    ASSERT_EQ(tokens.size(), 12u);
    EXPECT_EQ(tokens[1].type, TokenType::And);
    EXPECT_EQ(tokens[3].type, TokenType::Or);
    EXPECT_EQ(tokens[4].type, TokenType::Not);
    EXPECT_EQ(tokens[6].type, TokenType::And);
    EXPECT_EQ(tokens[8].type, TokenType::Or);
    EXPECT_EQ(tokens[9].type, TokenType::Not);
}

TEST(Tokenizer, SymbolicBooleanOperators) {
    Tokenizer tokenizer("a && b || !c");
    auto tokens = tokenizer.Tokenize();

    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[1].type, TokenType::And);
    EXPECT_EQ(tokens[3].type, TokenType::Or);
    EXPECT_EQ(tokens[4].type, TokenType::Not);
}

TEST(Tokenizer, DottedIdentifiers) {
    Tokenizer tokenizer("JustRan(stage.encoder_1)");
    auto tokens = tokenizer.Tokenize();

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[2].value, "stage.encoder_1");
}

TEST(Tokenizer, UnexpectedCharacter) {
    Tokenizer tokenizer("AtPass(0) $");
    EXPECT_THROW(tokenizer.Tokenize(), ConditionError);
}

TEST(Tokenizer, MalformedNumber) {
    Tokenizer tokenizer("AtPass(3x)");
    EXPECT_THROW(tokenizer.Tokenize(), ConditionError);
}

// ============================================================================
// Parser Tests
// ============================================================================

class ConditionParserTest : public ::testing::Test {
  protected:
    ConditionParser parser;

    std::string Canonical(const std::string &expr) { return parser.Parse(expr)->ToString(); }
};

TEST_F(ConditionParserTest, Constants) {
    EXPECT_EQ(Canonical("Always"), "Always");
    EXPECT_EQ(Canonical("Never()"), "Never");
}

TEST_F(ConditionParserTest, ClockConditions) {
    EXPECT_EQ(Canonical("AtPass(0)"), "AtPass(0)");
    EXPECT_EQ(Canonical("EveryNPasses(3, RUN)"), "EveryNPasses(3, RUN)");
    EXPECT_EQ(Canonical("AfterNTrials(2)"), "AfterNTrials(2)");
    EXPECT_EQ(Canonical("BeforeTrial(4, LIFE)"), "BeforeTrial(4, LIFE)");
}

TEST_F(ConditionParserTest, CallCountConditions) {
    EXPECT_EQ(Canonical("AfterNCalls(B, 4)"), "AfterNCalls(B, 4)");
    EXPECT_EQ(Canonical("AtNCalls(B, 1, PASS)"), "AtNCalls(B, 1, PASS)");
    EXPECT_EQ(Canonical("AfterNCallsCombined(A, B, 5)"), "AfterNCallsCombined(A, B, 5)");
    EXPECT_EQ(Canonical("AfterNCallsCombined(A, B, 5, RUN)"),
              "AfterNCallsCombined(A, B, 5, RUN)");
    EXPECT_EQ(Canonical("EveryNCalls(A, 2)"), "EveryNCalls(A, 2)");
}

TEST_F(ConditionParserTest, HistoryAndFinished) {
    EXPECT_EQ(Canonical("JustRan(A)"), "JustRan(A)");
    EXPECT_EQ(Canonical("AllHaveRun"), "AllHaveRun()");
    EXPECT_EQ(Canonical("AllHaveRun(A, B, PASS)"), "AllHaveRun(A, B, PASS)");
    EXPECT_EQ(Canonical("WhenFinished(A)"), "WhenFinished(A)");
    EXPECT_EQ(Canonical("WhenFinishedAll"), "WhenFinishedAll()");
    EXPECT_EQ(Canonical("WhenFinishedAny(A, B)"), "WhenFinishedAny(A, B)");
}

TEST_F(ConditionParserTest, FunctionCombinators) {
    EXPECT_EQ(Canonical("Any(AtPass(0), EveryNCalls(B, 2))"), "Any(AtPass(0), EveryNCalls(B, 2))");
    EXPECT_EQ(Canonical("All(AfterNCalls(A, 1), Not(JustRan(A)))"),
              "All(AfterNCalls(A, 1), Not(JustRan(A)))");
    EXPECT_EQ(Canonical("AtLeastN(2, Always, Never, AtPass(1))"),
              "AtLeastN(2, Always, Never, AtPass(1))");
}

TEST_F(ConditionParserTest, InfixOperators) {
    EXPECT_EQ(Canonical("AtPass(0) or EveryNCalls(B, 2)"), "Any(AtPass(0), EveryNCalls(B, 2))");
    EXPECT_EQ(Canonical("AtPass(0) && !JustRan(A)"), "All(AtPass(0), Not(JustRan(A)))");
}

TEST_F(ConditionParserTest, AndBindsTighterThanOr) {
    EXPECT_EQ(Canonical("Always OR Never AND AtPass(1)"), "Any(Always, All(Never, AtPass(1)))");
    EXPECT_EQ(Canonical("(Always OR Never) AND AtPass(1)"), "All(Any(Always, Never), AtPass(1))");
}

TEST_F(ConditionParserTest, ChainsFlatten) {
    EXPECT_EQ(Canonical("Always or Never or AtPass(2)"), "Any(Always, Never, AtPass(2))");
}

TEST_F(ConditionParserTest, EvaluatesCompiledTree) {
    SchedulerState state({"A", "B"});
    state.Counters().RecordExecution("A");
    state.Counters().RecordExecution("A");

    auto cond = parser.Parse("EveryNCalls(A, 2) and not AfterNCalls(B, 1)");
    EXPECT_TRUE(cond->IsSatisfied(state, "B"));

    state.Counters().RecordExecution("B");
    EXPECT_FALSE(cond->IsSatisfied(state, "B"));
}

// ============================================================================
// Parser Errors
// ============================================================================

TEST_F(ConditionParserTest, EmptyExpression) {
    EXPECT_THROW((void)parser.Parse(""), ConditionError);
    EXPECT_THROW((void)parser.Parse("   "), ConditionError);
}

TEST_F(ConditionParserTest, UnknownFunction) {
    try {
        (void)parser.Parse("Always and Sometimes(1)");
        FAIL() << "expected ConditionError";
    } catch (const ConditionError &e) {
        EXPECT_NE(std::string(e.what()).find("Unknown condition 'Sometimes' at position 11"),
                  std::string::npos);
    }
}

TEST_F(ConditionParserTest, WrongArity) {
    EXPECT_THROW((void)parser.Parse("AfterNCalls(A)"), ConditionError);
    EXPECT_THROW((void)parser.Parse("AtPass(1, TRIAL, RUN)"), ConditionError);
    EXPECT_THROW((void)parser.Parse("Not(Always, Never)"), ConditionError);
}

TEST_F(ConditionParserTest, WrongArgumentKind) {
    EXPECT_THROW((void)parser.Parse("AfterNCalls(2, A)"), ConditionError);
    EXPECT_THROW((void)parser.Parse("AtPass(1, HOUR)"), ConditionError);
    EXPECT_THROW((void)parser.Parse("AtPass"), ConditionError);
    EXPECT_THROW((void)parser.Parse("Any(3)"), ConditionError);
}

TEST_F(ConditionParserTest, UnbalancedParentheses) {
    EXPECT_THROW((void)parser.Parse("Any(Always, Never"), ConditionError);
    EXPECT_THROW((void)parser.Parse("(Always"), ConditionError);
}

TEST_F(ConditionParserTest, TrailingTokens) {
    EXPECT_THROW((void)parser.Parse("Always Never"), ConditionError);
    EXPECT_THROW((void)parser.Parse("AtPass(1))"), ConditionError);
}

TEST_F(ConditionParserTest, NestingDepthIsCapped) {
    const std::size_t limit = ConditionParser::kMaxNestingDepth;
    auto parens = [](std::size_t n) {
        return std::string(n, '(') + "Always" + std::string(n, ')');
    };
    auto nots = [](std::size_t n) {
        std::string expr;
        for (std::size_t i = 0; i < n; ++i) {
            expr += "not ";
        }
        return expr + "Always";
    };

    EXPECT_NO_THROW((void)parser.Parse(parens(limit - 1)));
    EXPECT_NO_THROW((void)parser.Parse(nots(limit - 1)));
    EXPECT_THROW((void)parser.Parse(parens(limit)), ConditionError);

    try {
        (void)parser.Parse(nots(20000));
        FAIL() << "expected ConditionError";
    } catch (const ConditionError &e) {
        EXPECT_NE(std::string(e.what()).find("nested deeper"), std::string::npos);
    }
    try {
        (void)parser.Parse(parens(20000));
        FAIL() << "expected ConditionError";
    } catch (const ConditionError &e) {
        EXPECT_NE(std::string(e.what()).find("nested deeper"), std::string::npos);
    }

    EXPECT_EQ(Canonical("Any(AtPass(0), Not(Never))"), "Any(AtPass(0), Not(Never))");
}

TEST(Tokenizer, KeywordType) {
    EXPECT_EQ(Tokenizer::KeywordType("and").value_or(TokenType::Eof), TokenType::And);
    EXPECT_EQ(Tokenizer::KeywordType("OR").value_or(TokenType::Eof), TokenType::Or);
    EXPECT_EQ(Tokenizer::KeywordType("not").value_or(TokenType::Eof), TokenType::Not);
    EXPECT_FALSE(Tokenizer::KeywordType("And").has_value());
    EXPECT_FALSE(Tokenizer::KeywordType("notify").has_value());
}

TEST_F(ConditionParserTest, InvalidCountsRejected) {
    EXPECT_THROW((void)parser.Parse("EveryNCalls(A, 0)"), ConditionError);
    EXPECT_THROW((void)parser.Parse("EveryNPasses(0)"), ConditionError);
}

TEST(ConditionParserScale, Keywords) {
    EXPECT_EQ(ConditionParser::ScaleKeyword("PASS"), TimeScale::Pass);
    EXPECT_EQ(ConditionParser::ScaleKeyword("TIME_STEP"), TimeScale::TimeStep);
    EXPECT_FALSE(ConditionParser::ScaleKeyword("pass").has_value());
}

// ============================================================================
// Predicates
// ============================================================================

TEST(ConditionParserPredicates, WhileLooksUpRegistry) {
    bool converged = false;
    PredicateRegistry registry;
    registry.Register("converged", [&] { return converged; });

    ConditionParser parser(registry);
    auto until = parser.Parse("NWhile(converged)");
    auto during = parser.Parse("While(converged)");
    EXPECT_EQ(until->ToString(), "NWhile(converged)");

    SchedulerState state({"A"});
    EXPECT_TRUE(until->IsSatisfied(state, "A"));
    EXPECT_FALSE(during->IsSatisfied(state, "A"));
    converged = true;
    EXPECT_FALSE(until->IsSatisfied(state, "A"));
    EXPECT_TRUE(during->IsSatisfied(state, "A"));
}

TEST(ConditionParserPredicates, UnknownPredicate) {
    PredicateRegistry registry;
    registry.Register("ready", [] { return true; });

    ConditionParser parser(registry);
    EXPECT_THROW((void)parser.Parse("While(steady)"), ConditionError);

    ConditionParser bare;
    EXPECT_THROW((void)bare.Parse("While(ready)"), ConditionError);
}

TEST(ConditionParserPredicates, Registry) {
    PredicateRegistry registry;
    registry.Register("b", [] { return true; });
    registry.Register("a", [] { return false; });

    EXPECT_TRUE(registry.Contains("a"));
    EXPECT_EQ(registry.Names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(registry.Get("a")());
    EXPECT_THROW((void)registry.Get("zzz"), ConditionError);
    EXPECT_THROW(registry.Register("empty", nullptr), ConditionError);
}
