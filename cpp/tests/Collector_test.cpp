// Collector_test.cpp
#include "gtest/gtest.h"
#include "Collector.h"
#include <memory>
#include <typeinfo>
#include <vector>

using namespace vialsim;

static TrialOutcome outcome(const double waste, const int day, const double dosage = 0.28) {
    return TrialOutcome{waste, day, 20, 0.0, Roster{{"Alice", dosage, 7}}};
}

static Draw draw(const uint64_t ordinal) {
    return Draw{ordinal, {0.04}, {7}};
}

static void feed(DataCollector& c, const uint64_t ordinal, const TrialOutcome& o) {
    c.reset();
    c.recordDraw(draw(ordinal));
    c.save(o);
}

TEST(RankingCollector, RanksByWasteThenOrdinal) {
    RankingCollector ranking;
    feed(ranking, 5, outcome(2.0, 100, 0.30));
    feed(ranking, 1, outcome(0.5, 90, 0.31));
    feed(ranking, 3, outcome(2.0, 101, 0.32));
    feed(ranking, 0, outcome(1.0, 95, 0.33));

    const auto ranked = ranking.ranked();
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].ordinal, 1u);
    EXPECT_EQ(ranked[1].ordinal, 0u);
    EXPECT_EQ(ranked[2].ordinal, 3u);
    EXPECT_EQ(ranked[3].ordinal, 5u);
}

TEST(RankingCollector, DeduplicatesKeepingLowestOrdinal) {
    RankingCollector ranking;
    feed(ranking, 7, outcome(1.25, 100));
    feed(ranking, 2, outcome(1.25, 100));
    feed(ranking, 9, outcome(1.25, 100));
    feed(ranking, 4, outcome(1.25, 101));

    EXPECT_EQ(ranking.size(), 2u);
    const auto ranked = ranking.ranked();
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].ordinal, 2u);
    EXPECT_EQ(ranked[1].ordinal, 4u);
}

TEST(RankingCollector, TopKKeepsBestAndMergeIsOrderIndependent) {
    RankingCollector left(3), right(3);
    for (uint64_t i = 0; i < 50; ++i) {
        const double waste = static_cast<double>((i * 37) % 50) / 10.0;
        auto& target = (i % 2 == 0) ? left : right;
        feed(target, i, outcome(waste, 100 + static_cast<int>(i)));
    }

    RankingCollector a(3), b(3);
    a.merge(left);
    a.merge(right);
    b.merge(right);
    b.merge(left);

    const auto ra = a.ranked();
    const auto rb = b.ranked();
    ASSERT_EQ(ra.size(), 3u);
    ASSERT_EQ(rb.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(ra[i].ordinal, rb[i].ordinal);
        EXPECT_DOUBLE_EQ(ra[i].outcome.waste, static_cast<double>(i) / 10.0);
    }
}

TEST(RankingCollector, CloneIsEmpty) {
    RankingCollector ranking(4);
    feed(ranking, 0, outcome(1.0, 10));
    const auto fresh = ranking.clone();
    const auto& copy = dynamic_cast<const RankingCollector&>(*fresh);
    EXPECT_EQ(copy.size(), 0u);
    EXPECT_EQ(copy.topK(), 4u);
}

TEST(Hist1D, BinsWasteAndMerges) {
    const CompiledExpression waste("waste", {"Alice"});
    Hist1D left(waste, 4, 0.0, 4.0);
    Hist1D right(waste, 4, 0.0, 4.0);

    feed(left, 0, outcome(0.5, 10));
    feed(left, 1, outcome(3.5, 10));
    feed(right, 2, outcome(3.99, 10));
    feed(right, 3, outcome(4.0, 10));
    feed(right, 4, outcome(7.0, 10));

    left.merge(right);
    const std::vector<long> expected = {1, 0, 0, 3};
    EXPECT_EQ(left.histogram(), expected);
    EXPECT_EQ(left.outOfRange(), 1);

    EXPECT_THROW(Hist1D(waste, 0, 0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Hist1D(waste, 4, 1.0, 1.0), std::invalid_argument);
}

TEST(DataCollectorGroup, ForwardsAndMerges) {
    std::vector<std::shared_ptr<DataCollector>> protos = {std::make_shared<RankingCollector>(0)};
    DataCollectorGroup total(protos);
    DataCollectorGroup worker(total);

    feed(worker, 0, outcome(1.0, 10));
    feed(worker, 1, outcome(2.0, 11));
    total.merge(worker);

    const auto& ranking = dynamic_cast<const RankingCollector&>(*total.at(0));
    EXPECT_EQ(ranking.size(), 2u);

    DataCollectorGroup empty;
    EXPECT_THROW(total.merge(empty), std::invalid_argument);
    EXPECT_THROW(total.merge(ranking), std::bad_cast);
}
