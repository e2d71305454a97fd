#include <gtest/gtest.h>
#include "authorizer/policy.hpp"
#include "authorizer/errors.hpp"
#include "authorizer/constants.hpp"

using namespace authorizer;

namespace {

const nlohmann::json HEADER = {{"alg", "RS256"}, {"kid", "rsa-key"}, {"typ", "JWT"}};

const nlohmann::json CLAIMS = {
    {"sub", "user-123"},
    {"email", "alice@example.com"},
    {"aud", {"my-client-id", "other"}},
    {"roles", {"admin", "editor"}},
    {"scopes", {"read:users", "read:groups"}},
    {"count", 10},
    {"ratio", 0.5},
    {"email_verified", true},
    {"org", {{"id", "org-1"}, {"tier", "gold"}}},
    {"name", "Zoë"}
};

nlohmann::json eval(std::string_view expression, const nlohmann::json& claims = CLAIMS) {
    return PolicyProgram::compile(expression).evaluate(HEADER, claims);
}

bool passes(std::string_view expression, const nlohmann::json& claims = CLAIMS) {
    return PolicyValidator::fromExpression(expression).validate(HEADER, TokenClaims(claims)).valid;
}

}

// ============================================================================
// Policy gate
// ============================================================================

TEST(PolicyValidatorTest, DisabledWithoutExpression) {
    auto validator = PolicyValidator::fromExpression("");

    EXPECT_FALSE(validator.enabled());
    EXPECT_EQ(validator.expression(), "");
    EXPECT_TRUE(validator.validate(HEADER, TokenClaims(CLAIMS)).valid);
}

TEST(PolicyValidatorTest, WhitespaceOnlyIsDisabled) {
    EXPECT_FALSE(PolicyValidator::fromExpression("  \n\t ").enabled());
}

TEST(PolicyValidatorTest, KeepsExpressionText) {
    auto validator = PolicyValidator::fromExpression("claims.sub == \"user-123\"");

    EXPECT_TRUE(validator.enabled());
    EXPECT_EQ(validator.expression(), "claims.sub == \"user-123\"");
}

TEST(PolicyValidatorTest, EmailDomainMatch) {
    EXPECT_TRUE(passes("claims.email.endsWith(\"@example.com\")"));
    EXPECT_FALSE(passes("claims.email.endsWith(\"@other.com\")"));
}

TEST(PolicyValidatorTest, EmailRegexMatch) {
    EXPECT_TRUE(passes(R"(claims.email.matches("^[a-z]+@[a-z]+\\.[a-z]+$"))"));
    EXPECT_FALSE(passes(R"(claims.email.matches("^[0-9]+$"))"));
}

TEST(PolicyValidatorTest, RoleMembership) {
    EXPECT_TRUE(passes("\"admin\" in claims.roles"));
    EXPECT_FALSE(passes("\"owner\" in claims.roles"));
}

TEST(PolicyValidatorTest, AudienceMembership) {
    EXPECT_TRUE(passes("\"my-client-id\" in claims.aud"));
}

TEST(PolicyValidatorTest, ExistsMacro) {
    EXPECT_TRUE(passes("claims.roles.exists(r, r == \"admin\")"));
    EXPECT_FALSE(passes("claims.roles.exists(r, r == \"owner\")"));
}

TEST(PolicyValidatorTest, AllMacro) {
    EXPECT_TRUE(passes("claims.scopes.all(s, s.startsWith(\"read:\"))"));
    EXPECT_FALSE(passes("claims.roles.all(r, r.startsWith(\"ad\"))"));
}

TEST(PolicyValidatorTest, Conditional) {
    EXPECT_TRUE(passes("claims.count > 5 ? true : false"));
    EXPECT_FALSE(passes("claims.count > 50 ? true : false"));
}

TEST(PolicyValidatorTest, OptionalClaimWithHas) {
    const std::string expression = "!has(claims.acr) || claims.acr == \"urn:mfa\"";

    EXPECT_TRUE(passes(expression));

    auto with_mfa = CLAIMS;
    with_mfa["acr"] = "urn:mfa";
    EXPECT_TRUE(passes(expression, with_mfa));

    auto with_password = CLAIMS;
    with_password["acr"] = "urn:password";
    EXPECT_FALSE(passes(expression, with_password));
}

TEST(PolicyValidatorTest, HeaderVariable) {
    EXPECT_TRUE(passes("header.alg == \"RS256\" && header.kid == \"rsa-key\""));
    EXPECT_FALSE(passes("header.alg.startsWith(\"ES\")"));
}

TEST(PolicyValidatorTest, NonBoolResultIsRejected) {
    auto result = PolicyValidator::fromExpression("claims.sub").validate(HEADER, TokenClaims(CLAIMS));

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.reason, DenyReason::PolicyRejected);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("bool"), std::string::npos);
}

TEST(PolicyValidatorTest, MissingClaimIsRejected) {
    auto result = PolicyValidator::fromExpression("claims.department == \"sales\"")
                      .validate(HEADER, TokenClaims(CLAIMS));

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.reason, DenyReason::PolicyRejected);
}

TEST(PolicyValidatorTest, FalseIsRejected) {
    auto result = PolicyValidator::fromExpression("false").validate(HEADER, TokenClaims(CLAIMS));
    EXPECT_EQ(result.reason, DenyReason::PolicyRejected);
}

TEST(PolicyValidatorTest, OversizedRegexSubjectIsRejected) {
    auto validator = PolicyValidator::fromExpression(R"(claims.name.matches("^(a|b)+$"))");

    auto atLimit = validator.validate(HEADER, TokenClaims(nlohmann::json{{"name", std::string(MAX_REGEX_SUBJECT_SIZE, 'a')}}));
    EXPECT_TRUE(atLimit.valid);

    auto oversized = validator.validate(HEADER, TokenClaims(nlohmann::json{{"name", std::string(48 * 1024, 'a')}}));
    EXPECT_FALSE(oversized.valid);
    EXPECT_EQ(oversized.reason, DenyReason::PolicyRejected);
}

// ============================================================================
// Compilation
// ============================================================================

TEST(PolicyCompileTest, InvalidSyntax) {
    EXPECT_THROW((void)PolicyValidator::fromExpression("invalid syntax {{{{"), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("claims.sub =="), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("(claims.sub"), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("claims.sub == \"open"), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("claims.sub # 1"), PolicyCompileError);
}

TEST(PolicyCompileTest, UndeclaredVariable) {
    EXPECT_THROW((void)PolicyProgram::compile("request.path == \"/\""), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("claims.roles.exists(r, x == \"admin\")"), PolicyCompileError);
}

TEST(PolicyCompileTest, IterationVariableOnlyInsidePredicate) {
    EXPECT_NO_THROW((void)PolicyProgram::compile("claims.roles.exists(r, r == \"admin\")"));
    EXPECT_THROW((void)PolicyProgram::compile("claims.roles.exists(r, true) && r == \"admin\""), PolicyCompileError);
}

TEST(PolicyCompileTest, UnknownFunctions) {
    EXPECT_THROW((void)PolicyProgram::compile("now() > 0"), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("claims.sub.toUpper() == \"X\""), PolicyCompileError);
}

TEST(PolicyCompileTest, WrongArity) {
    EXPECT_THROW((void)PolicyProgram::compile("claims.sub.startsWith()"), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("size(claims.roles, 1) > 0"), PolicyCompileError);
}

TEST(PolicyCompileTest, HasRequiresFieldSelection) {
    EXPECT_THROW((void)PolicyProgram::compile("has(claims)"), PolicyCompileError);
    EXPECT_THROW((void)PolicyProgram::compile("has(claims[\"acr\"])"), PolicyCompileError);
}

TEST(PolicyCompileTest, InvalidLiteralRegex) {
    EXPECT_THROW((void)PolicyProgram::compile("claims.email.matches(\"[unclosed\")"), PolicyCompileError);
}

TEST(PolicyCompileTest, IntegerLiteralOutOfRange) {
    EXPECT_THROW((void)PolicyProgram::compile("claims.count < 99999999999999999999"), PolicyCompileError);
}

TEST(PolicyCompileTest, NestingLimit) {
    std::string shallow = std::string(10, '(') + "true" + std::string(10, ')');
    EXPECT_NO_THROW((void)PolicyProgram::compile(shallow));

    std::string parens = std::string(MAX_POLICY_DEPTH + 10, '(') + "true" + std::string(MAX_POLICY_DEPTH + 10, ')');
    EXPECT_THROW((void)PolicyProgram::compile(parens), PolicyCompileError);

    std::string negations = std::string(MAX_POLICY_DEPTH + 10, '!') + "true";
    EXPECT_THROW((void)PolicyProgram::compile(negations), PolicyCompileError);
}

TEST(PolicyCompileTest, CommentsAndWhitespace) {
    EXPECT_TRUE(passes("// role check\n\"admin\" in claims.roles // trailing\n"));
}

// ============================================================================
// Evaluation semantics
// ============================================================================

TEST(PolicyEvalTest, Literals) {
    EXPECT_EQ(eval("42"), 42);
    EXPECT_EQ(eval("0x1F"), 31);
    EXPECT_EQ(eval("7u"), 7);
    EXPECT_DOUBLE_EQ(eval("2.5").get<double>(), 2.5);
    EXPECT_DOUBLE_EQ(eval("1e3").get<double>(), 1000.0);
    EXPECT_EQ(eval("'single'"), "single");
    EXPECT_EQ(eval(R"("tab\there")"), "tab\there");
    EXPECT_EQ(eval(R"(r"\d+")"), "\\d+");
    EXPECT_EQ(eval(R"("é")"), "\xc3\xa9");
    EXPECT_TRUE(eval("null").is_null());
    EXPECT_EQ(eval("[1, 2, 3]"), nlohmann::json({1, 2, 3}));
}

TEST(PolicyEvalTest, TripleQuotedString) {
    EXPECT_EQ(eval("\"\"\"two\nlines\"\"\""), "two\nlines");
}

TEST(PolicyEvalTest, Arithmetic) {
    EXPECT_EQ(eval("1 + 2 * 3"), 7);
    EXPECT_EQ(eval("(1 + 2) * 3"), 9);
    EXPECT_EQ(eval("7 / 2"), 3);
    EXPECT_EQ(eval("-7 % 3"), -1);
    EXPECT_DOUBLE_EQ(eval("claims.ratio * 4.0").get<double>(), 2.0);
    EXPECT_EQ(eval("\"ab\" + \"cd\""), "abcd");
    EXPECT_EQ(eval("[1] + [2]"), nlohmann::json({1, 2}));
}

TEST(PolicyEvalTest, ArithmeticErrors) {
    EXPECT_THROW((void)eval("1 / 0"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("1 % 0"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("9223372036854775807 + 1"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("\"a\" + 1"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("1.5 % 2.0"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, NumericComparisonAcrossTypes) {
    EXPECT_EQ(eval("claims.count == 10.0"), true);
    EXPECT_EQ(eval("claims.ratio < 1"), true);
    EXPECT_EQ(eval("3 >= 3"), true);
}

TEST(PolicyEvalTest, EqualityOfDifferentTypesIsFalse) {
    EXPECT_EQ(eval("claims.count == \"10\""), false);
    EXPECT_EQ(eval("claims.sub != 1"), true);
    EXPECT_EQ(eval("null == false"), false);
}

TEST(PolicyEvalTest, StructuralEquality) {
    EXPECT_EQ(eval("claims.roles == [\"admin\", \"editor\"]"), true);
    EXPECT_EQ(eval("claims.roles == [\"editor\", \"admin\"]"), false);
}

TEST(PolicyEvalTest, OrderingTypeMismatchIsError) {
    EXPECT_THROW((void)eval("claims.sub < 5"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, StringOrdering) {
    EXPECT_EQ(eval("\"apple\" < \"banana\""), true);
}

TEST(PolicyEvalTest, InOperator) {
    EXPECT_EQ(eval("\"tier\" in claims.org"), true);
    EXPECT_EQ(eval("\"plan\" in claims.org"), false);
    EXPECT_EQ(eval("\"example\" in claims.email"), true);
    EXPECT_EQ(eval("10.0 in [10, 20]"), true);
    EXPECT_THROW((void)eval("1 in claims.count"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, FieldAndIndexAccess) {
    EXPECT_EQ(eval("claims.org.tier"), "gold");
    EXPECT_EQ(eval("claims[\"org\"][\"id\"]"), "org-1");
    EXPECT_EQ(eval("claims.roles[1]"), "editor");
    EXPECT_THROW((void)eval("claims.roles[5]"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("claims.roles[-1]"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("claims.roles[\"x\"]"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("claims.sub.field"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, AndOrAbsorbErrors) {
    // The missing claim errors, but the other side decides
    EXPECT_EQ(eval("claims.missing == 1 || true"), true);
    EXPECT_EQ(eval("true || claims.missing == 1"), true);
    EXPECT_EQ(eval("claims.missing == 1 && false"), false);
    EXPECT_EQ(eval("false && claims.missing == 1"), false);

    EXPECT_THROW((void)eval("claims.missing == 1 || false"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("true && claims.missing == 1"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, LogicalOperandsMustBeBool) {
    EXPECT_THROW((void)eval("claims.count && true"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("!claims.sub"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("claims.sub ? 1 : 2"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, ConditionalOnlyEvaluatesChosenBranch) {
    EXPECT_EQ(eval("has(claims.missing) ? claims.missing : \"fallback\""), "fallback");
}

TEST(PolicyEvalTest, HasOnNestedPaths) {
    EXPECT_EQ(eval("has(claims.org.tier)"), true);
    EXPECT_EQ(eval("has(claims.org.plan)"), false);
    EXPECT_EQ(eval("has(claims.missing.field)"), false);
    EXPECT_EQ(eval("has(header.typ)"), true);
}

TEST(PolicyEvalTest, SizeCountsCodePoints) {
    EXPECT_EQ(eval("size(claims.name)"), 3);
    EXPECT_EQ(eval("claims.name.size()"), 3);
    EXPECT_EQ(eval("size(claims.roles)"), 2);
    EXPECT_EQ(eval("size(claims.org)"), 2);
    EXPECT_THROW((void)eval("size(claims.count)"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, StringFunctions) {
    EXPECT_EQ(eval("claims.email.contains(\"@\")"), true);
    EXPECT_EQ(eval("claims.email.startsWith(\"alice\")"), true);
    EXPECT_EQ(eval("\"a\".startsWith(\"abc\")"), false);
    EXPECT_EQ(eval("\"a\".endsWith(\"abc\")"), false);
    EXPECT_THROW((void)eval("claims.count.startsWith(\"1\")"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, MatchesWithDynamicPattern) {
    EXPECT_EQ(eval("claims.sub.matches(\"^user-\" + \"[0-9]+$\")"), true);
    EXPECT_EQ(eval("claims.email.matches(\"example\")"), true);

    nlohmann::json longPattern = {{"pattern", std::string(MAX_REGEX_SUBJECT_SIZE + 1, 'a')}};
    EXPECT_THROW((void)eval("\"aaa\".matches(claims.pattern)", longPattern), PolicyEvaluationError);
}

TEST(PolicyEvalTest, Conversions) {
    EXPECT_EQ(eval("int(\"42\")"), 42);
    EXPECT_EQ(eval("int(2.9)"), 2);
    EXPECT_EQ(eval("string(10)"), "10");
    EXPECT_EQ(eval("string(true)"), "true");
    EXPECT_THROW((void)eval("int(\"4x\")"), PolicyEvaluationError);
    EXPECT_THROW((void)eval("string(claims.roles)"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, Quantifiers) {
    EXPECT_EQ(eval("claims.roles.exists_one(r, r.startsWith(\"ad\"))"), true);
    EXPECT_EQ(eval("claims.scopes.exists_one(s, s.startsWith(\"read:\"))"), false);
    EXPECT_EQ(eval("[].all(x, x > 0)"), true);
    EXPECT_EQ(eval("[].exists(x, x > 0)"), false);
    EXPECT_EQ(eval("claims.org.exists(k, k == \"tier\")"), true);
    EXPECT_THROW((void)eval("claims.sub.exists(c, true)"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, QuantifierAbsorbsErrorsWhenDecided) {
    // "x" > 0 errors, but 5 > 0 decides exists
    EXPECT_EQ(eval("[\"x\", 5].exists(v, v > 0)"), true);
    EXPECT_THROW((void)eval("[\"x\", -5].exists(v, v > 0)"), PolicyEvaluationError);
    EXPECT_EQ(eval("[\"x\", -5].all(v, v > 0)"), false);
}

TEST(PolicyEvalTest, QuantifierPredicateMustBeBool) {
    EXPECT_THROW((void)eval("claims.roles.all(r, r)"), PolicyEvaluationError);
}

TEST(PolicyEvalTest, NestedQuantifiersSeeOuterVariable) {
    EXPECT_EQ(eval("[1, 2].all(a, [2, 3].exists(b, b > a))"), true);
}
