#include <gtest/gtest.h>
#include "aggregator.hpp"
#include <random>

namespace {

Finding makeFinding(Category category, size_t start, size_t end, double confidence) {
    Finding f;
    f.category = category;
    f.start = start;
    f.end = end;
    f.value = std::string(end - start, 'x');
    f.display = f.value;
    f.confidence = confidence;
    return f;
}

}

TEST(AggregatorTest, HigherConfidenceWinsSameCategoryOverlap) {
    Aggregator aggregator;
    aggregator.add(makeFinding(Category::PHONE, 0, 11, 0.7));
    aggregator.add(makeFinding(Category::PHONE, 5, 12, 0.9));
    auto report = aggregator.finish("src");
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].start, 5u);
}

TEST(AggregatorTest, LongerSpanBreaksConfidenceTie) {
    Aggregator aggregator;
    aggregator.add(makeFinding(Category::ADDRESS, 0, 4, 0.5));
    aggregator.add(makeFinding(Category::ADDRESS, 2, 12, 0.5));
    auto report = aggregator.finish("src");
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].end, 12u);
}

TEST(AggregatorTest, EarlierStartBreaksRemainingTie) {
    Aggregator aggregator;
    aggregator.add(makeFinding(Category::EMAIL, 3, 9, 0.7));
    aggregator.add(makeFinding(Category::EMAIL, 1, 7, 0.7));
    auto report = aggregator.finish("src");
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].start, 1u);
}

TEST(AggregatorTest, DifferentCategoriesMayOverlap) {
    Aggregator aggregator;
    aggregator.add(makeFinding(Category::ADDRESS, 0, 30, 0.9));
    aggregator.add(makeFinding(Category::PHONE, 10, 21, 0.7));
    auto report = aggregator.finish("src");
    ASSERT_EQ(report.findings.size(), 2u);
    EXPECT_EQ(report.findings[0].category, Category::ADDRESS);
    EXPECT_EQ(report.findings[1].category, Category::PHONE);
}

TEST(AggregatorTest, OrderedByStartAndFilteredByConfidence) {
    Aggregator aggregator(0.6);
    aggregator.add(makeFinding(Category::IP_ADDRESS, 40, 50, 0.7));
    aggregator.add(makeFinding(Category::PHONE, 20, 31, 0.9));
    aggregator.add(makeFinding(Category::ADDRESS, 0, 8, 0.5));
    aggregator.add(makeFinding(Category::EMAIL, 5, 15, 0.7));
    auto report = aggregator.finish("src");
    EXPECT_EQ(report.source, "src");
    ASSERT_EQ(report.findings.size(), 3u);
    EXPECT_EQ(report.findings[0].start, 5u);
    EXPECT_EQ(report.findings[1].start, 20u);
    EXPECT_EQ(report.findings[2].start, 40u);
}

TEST(AggregatorTest, NoSameCategoryOverlapOnRandomInput) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<size_t> startDist(0, 200);
    std::uniform_int_distribution<size_t> lengthDist(1, 25);
    std::uniform_int_distribution<int> categoryDist(0, 3);
    std::uniform_int_distribution<int> confidenceDist(5, 9);

    for (int round = 0; round < 50; ++round) {
        Aggregator aggregator;
        for (int i = 0; i < 60; ++i) {
            size_t start = startDist(rng);
            aggregator.add(makeFinding(static_cast<Category>(categoryDist(rng)), start,
                                       start + lengthDist(rng), confidenceDist(rng) / 10.0));
        }
        auto report = aggregator.finish("random");
        ASSERT_FALSE(report.findings.empty());
        for (size_t i = 0; i < report.findings.size(); ++i) {
            if (i > 0)
                EXPECT_LE(report.findings[i - 1].start, report.findings[i].start);
            for (size_t j = i + 1; j < report.findings.size(); ++j) {
                const auto& a = report.findings[i];
                const auto& b = report.findings[j];
                if (a.category == b.category)
                    EXPECT_FALSE(Aggregator::overlaps(a, b)) << "round " << round;
            }
        }
    }
}

TEST(AggregatorTest, OverlapIsHalfOpen) {
    EXPECT_FALSE(Aggregator::overlaps(makeFinding(Category::PHONE, 0, 5, 0.7),
                                      makeFinding(Category::PHONE, 5, 9, 0.7)));
    EXPECT_TRUE(Aggregator::overlaps(makeFinding(Category::PHONE, 0, 6, 0.7),
                                     makeFinding(Category::PHONE, 5, 9, 0.7)));
}
