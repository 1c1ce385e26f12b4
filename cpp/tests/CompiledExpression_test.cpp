// CompiledExpression_test.cpp
#include "gtest/gtest.h"
#include "CompiledExpression.h"
#include "Criterion.h"
#include <cmath>
#include <memory>
#include <vector>

using namespace vialsim;

static const std::vector<std::string> names = {"Alice", "Bob"};

static Draw draw(const double aliceRate, const int aliceFreq, const double bobRate, const int bobFreq) {
    return Draw{0, {aliceRate, bobRate}, {aliceFreq, bobFreq}};
}

TEST(CompiledExpression, BindsPerPersonVariables) {
    const CompiledExpression dose("Alice_dose", names);
    EXPECT_DOUBLE_EQ(dose.eval(draw(0.04, 7, 0.06, 4)), 0.28);

    EXPECT_DOUBLE_EQ(CompiledExpression("Bob_dose", names).eval(draw(0.04, 7, 0.061, 5)), 0.30);

    const CompiledExpression rate("Bob_rate * 1000", names);
    EXPECT_NEAR(rate.eval(draw(0.04, 7, 0.061, 4)), 61.0, 1e-9);

    const CompiledExpression compare("Alice_freq > Bob_freq", names);
    EXPECT_EQ(compare.eval(draw(0.04, 7, 0.06, 4)), 1.0);
    EXPECT_EQ(compare.eval(draw(0.04, 4, 0.06, 5)), 0.0);

    EXPECT_EQ(compare.expr(), "Alice_freq > Bob_freq");
    EXPECT_EQ(compare.names(), names);
}

TEST(CompiledExpression, OutcomeVariables) {
    const CompiledExpression total("waste + days + vials", names);
    EXPECT_TRUE(std::isnan(total.eval(draw(0.04, 7, 0.06, 4))));

    const TrialOutcome outcome{1.5, 10, 20, 0.0, {}};
    EXPECT_DOUBLE_EQ(total.eval(draw(0.04, 7, 0.06, 4), outcome), 31.5);
}

TEST(CompiledExpression, CompileErrors) {
    EXPECT_THROW(CompiledExpression("Alice_rate +", names), std::runtime_error);
    EXPECT_THROW(CompiledExpression("Carol_rate", names), std::runtime_error);
    EXPECT_THROW(CompiledExpression("1", {"Bob", "Bob"}), std::invalid_argument);
}

TEST(CompiledExpression, CopiesEvaluateIndependently) {
    const CompiledExpression original("Alice_rate + Bob_rate", names);
    const CompiledExpression copy(original);
    EXPECT_EQ(copy.expr(), original.expr());

    EXPECT_DOUBLE_EQ(original.eval(draw(1.0, 1, 2.0, 1)), 3.0);
    EXPECT_DOUBLE_EQ(copy.eval(draw(10.0, 1, 20.0, 1)), 30.0);
    EXPECT_DOUBLE_EQ(original.eval(draw(1.0, 1, 2.0, 1)), 3.0);
}

TEST(CompiledExpression, RejectsDrawOfWrongWidth) {
    const CompiledExpression expr("Alice_rate", names);
    EXPECT_THROW(expr.eval(Draw{0, {0.04}, {7}}), std::invalid_argument);
    EXPECT_THROW(expr.eval(Draw{0, {0.04, 0.06}, {7}}), std::invalid_argument);
}

TEST(Criterion, BuiltinsAndGroup) {
    const Draw d = draw(0.04, 7, 0.06, 4);
    const TrialOutcome outcome{1.5, 10, 20, 0.0, {}};

    EXPECT_TRUE(WasteCriterion(1.5).passed(d, outcome));
    EXPECT_FALSE(WasteCriterion(1.0).passed(d, outcome));
    EXPECT_THROW(WasteCriterion(-1.0), std::invalid_argument);

    EXPECT_TRUE(DurationCriterion(10, 12).passed(d, outcome));
    EXPECT_FALSE(DurationCriterion(1, 9).passed(d, outcome));
    EXPECT_THROW(DurationCriterion(5, 4), std::invalid_argument);

    const ExpressionCriterion weekly(CompiledExpression("Alice_freq == 7 and waste < 2", names));
    EXPECT_TRUE(weekly.passed(d, outcome));
    EXPECT_FALSE(weekly.passed(draw(0.04, 8, 0.06, 4), outcome));

    std::vector<std::shared_ptr<Criterion>> criteria = {
        std::make_shared<WasteCriterion>(2.0),
        std::make_shared<DurationCriterion>(1, 9)
    };
    const CriterionGroup group(criteria);
    EXPECT_EQ(group.size(), 2u);
    EXPECT_FALSE(group.passed(d, outcome));
    EXPECT_TRUE(CriterionGroup().passed(d, outcome));

    const auto copy = group.clone();
    EXPECT_FALSE(copy->passed(d, outcome));
}
