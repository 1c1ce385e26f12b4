// Sweep_test.cpp
#include "gtest/gtest.h"
#include "Sweep.h"
#include "Report.h"
#include <memory>
#include <string>
#include <vector>

using namespace vialsim;

struct SweepRun {
    SweepSummary summary;
    std::vector<RankedOutcome> ranked;
    std::string report;
};

static SweepRun runSweep(const Sampler& sampler, const std::vector<Person>& people, const int numVials,
                         const double vialVolume, const CriterionGroup& criteria = CriterionGroup(),
                         const int workers = 1, const std::string& validator = "1", const size_t topK = 0) {
    const auto names = uniqueNames(people);
    std::vector<std::unique_ptr<DataCollector>> collectors;
    collectors.push_back(std::make_unique<RankingCollector>(topK));
    DataCollectorGroup group(collectors);

    Sweep sweep(sampler, people, numVials, vialVolume, criteria, group, 8, workers,
                CompiledExpression(validator, names));
    sweep.run();

    const auto& ranking = dynamic_cast<const RankingCollector&>(*sweep.collectors().at(0));
    return SweepRun{sweep.summary(), ranking.ranked(), formatReport(sweep.summary(), ranking, names, numVials, 5)};
}

static std::vector<Person> referencePeople() {
    return {
        Person("Alice", doseRange(0.038, 0.042, 0.001), {7, 8}),
        Person("Bob", doseRange(0.06, 0.063, 0.001), {4, 5}),
        Person("Charlie", doseRange(0.049, 0.052, 0.001), {5, 6, 7})
    };
}

TEST(Sweep, RankingIsIndependentOfWorkerCount) {
    const auto people = referencePeople();
    CartesianSampler sampler(people);

    const auto serial = runSweep(sampler, people, 20, 5.0, CriterionGroup(), 1, "1", 5);
    const auto parallel = runSweep(sampler, people, 20, 5.0, CriterionGroup(), 4, "1", 5);

    EXPECT_EQ(serial.summary.total, 720u);
    EXPECT_EQ(serial.summary.completed, 720u);
    EXPECT_EQ(parallel.summary.total, 720u);

    ASSERT_EQ(serial.ranked.size(), 5u);
    ASSERT_EQ(parallel.ranked.size(), 5u);
    for (size_t i = 0; i < serial.ranked.size(); ++i) {
        EXPECT_EQ(serial.ranked[i].ordinal, parallel.ranked[i].ordinal) << "rank " << i;
        EXPECT_DOUBLE_EQ(serial.ranked[i].outcome.waste, parallel.ranked[i].outcome.waste);
        EXPECT_EQ(serial.ranked[i].outcome.day, parallel.ranked[i].outcome.day);
        if (i > 0) EXPECT_LE(serial.ranked[i - 1].outcome.waste, serial.ranked[i].outcome.waste);
    }
    EXPECT_EQ(serial.report, parallel.report);
}

TEST(Sweep, CountsAddUpToTotal) {
    const std::vector<Person> people = {Person("A", {0.5, 10.0}, {1})};
    CartesianSampler sampler(people);
    const auto run = runSweep(sampler, people, 2, 5.0);

    const auto& s = run.summary;
    EXPECT_EQ(s.total, 2u);
    EXPECT_EQ(s.aborted, 1u);
    EXPECT_EQ(s.completed, 1u);
    EXPECT_EQ(s.completed + s.aborted + s.filtered + s.rejected, s.total);
    ASSERT_EQ(run.ranked.size(), 1u);
    EXPECT_EQ(run.ranked.front().ordinal, 0u);

    EXPECT_EQ(run.report.rfind("1 trials were aborted.\n"
                               "This is likely a result of having a dose larger than the vial volume or a "
                               "negative dose. \n\n", 0), 0u);
}

TEST(Sweep, NoUsableScheduleWhenEveryDrawAborts) {
    const std::vector<Person> people = {Person("A", {10.0, 12.0}, {1})};
    CartesianSampler sampler(people);
    const auto names = uniqueNames(people);
    DataCollectorGroup group;

    Sweep sweep(sampler, people, 1, 5.0, CriterionGroup(), group, 8, 2, CompiledExpression("1", names));
    EXPECT_THROW(sweep.run(), NoUsableScheduleError);
    EXPECT_EQ(sweep.summary().aborted, 2u);
    EXPECT_EQ(sweep.summary().completed, 0u);
    EXPECT_THROW(sweep.run(), std::logic_error) << "a sweep runs once";
}

TEST(Sweep, ValidatorFiltersDraws) {
    const auto people = referencePeople();
    CartesianSampler sampler(people);
    const auto run = runSweep(sampler, people, 20, 5.0, CriterionGroup(), 3, "Alice_freq == 7");

    EXPECT_EQ(run.summary.filtered, 360u);
    EXPECT_EQ(run.summary.completed, 360u);
    for (const auto& r : run.ranked) {
        const auto& roster = r.outcome.roster;
        for (const auto& p : roster)
            if (p.name == "Alice") EXPECT_EQ(p.frequency, 7);
    }
}

TEST(Sweep, CriteriaRejectCompletedTrials) {
    // A 2.5 mL dose empties the vial exactly; a 2.0 mL dose leaves 1.0 mL to discard.
    const std::vector<Person> people = {Person("A", {2.0, 2.5}, {1})};
    CartesianSampler sampler(people);
    std::vector<std::unique_ptr<Criterion>> criteria;
    criteria.push_back(std::make_unique<WasteCriterion>(0.5));

    const auto run = runSweep(sampler, people, 1, 5.0, CriterionGroup(criteria));
    EXPECT_EQ(run.summary.rejected, 1u);
    EXPECT_EQ(run.summary.completed, 1u);
    ASSERT_EQ(run.ranked.size(), 1u);
    EXPECT_EQ(run.ranked.front().ordinal, 1u);
    EXPECT_DOUBLE_EQ(run.ranked.front().outcome.waste, 0.0);
}

TEST(Sweep, ReportText) {
    const std::vector<Person> people = {Person("A", {2.0}, {1})};
    CartesianSampler sampler(people);
    const auto run = runSweep(sampler, people, 1, 5.0);

    const std::string expected =
        "The least wasteful dosage schedules are:\n"
        "Optimal outcome: 1\n"
        "Total wasted medicine:  1.00  mL\n"
        "In 2 days, you will have used 1 vials\n"
        "A's dosage: 2.00 mL every 1 days\n"
        "\n";
    EXPECT_EQ(run.report, expected);
}

TEST(Sweep, ReportListsPeopleInInputOrder) {
    const std::vector<Person> people = {Person("B", {1.0}, {1}), Person("A", {3.0}, {1})};
    CartesianSampler sampler(people);
    const auto run = runSweep(sampler, people, 3, 5.0);

    ASSERT_EQ(run.ranked.size(), 1u);
    EXPECT_EQ(run.ranked.front().outcome.roster.front().name, "A") << "the roster is sorted by dosage";
    const auto b = run.report.find("B's dosage: 1.00 mL every 1 days");
    const auto a = run.report.find("A's dosage: 3.00 mL every 1 days");
    ASSERT_NE(b, std::string::npos);
    ASSERT_NE(a, std::string::npos);
    EXPECT_LT(b, a);
}

TEST(Sweep, DuplicateOutcomesAreReportedOnce) {
    // Both rates round to a 0.50 mL dose, so the trials are indistinguishable.
    const std::vector<Person> people = {Person("A", {0.501, 0.502}, {1})};
    PreselectedSampler sampler(std::vector<Draw>{{0, {0.501}, {1}}, {0, {0.502}, {1}}});
    const auto run = runSweep(sampler, people, 1, 5.0, CriterionGroup(), 2);

    EXPECT_EQ(run.summary.completed, 2u);
    ASSERT_EQ(run.ranked.size(), 1u);
    EXPECT_EQ(run.ranked.front().ordinal, 0u);
}

TEST(Sweep, RejectsBadConfiguration) {
    const std::vector<Person> people = {Person("A", {2.0}, {1})};
    CartesianSampler sampler(people);
    const CriterionGroup criteria;
    const DataCollectorGroup group;
    const CompiledExpression validator("1", {"A"});

    EXPECT_THROW(Sweep(sampler, people, 1, 5.0, criteria, group, 8, 1, CompiledExpression("1", {"Other"})),
                 std::invalid_argument);
    EXPECT_THROW(Sweep(sampler, people, 0, 5.0, criteria, group, 8, 1, validator), std::invalid_argument);
    EXPECT_THROW(Sweep(sampler, people, 1, 0.0, criteria, group, 8, 1, validator), std::invalid_argument);
    EXPECT_THROW(Sweep(sampler, people, 1, 5.0, criteria, group, 0, 1, validator), std::invalid_argument);
    EXPECT_THROW(Sweep(sampler, people, 1, 5.0, criteria, group, 8, 0, validator), std::invalid_argument);
}
