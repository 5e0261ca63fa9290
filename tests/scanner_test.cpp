#include <gtest/gtest.h>
#include "scanner.hpp"
#include "printer.hpp"
#include <map>
#include <memory>
#include <utility>

namespace {

const char* kSampleText =
    "联系方式：张三，手机号码13812345678，座机010-62345678\n"
    "家庭住址：北京市海淀区中关村南大街5号，邮编100081\n"
    "身份证号：110101199003077512\n"
    "电子邮箱：zhangsan@example.com\n"
    "银行卡：4111 1111 1111 1111\n"
    "登录信息：用户名admin，密码：Admin@123456\n"
    "服务器IP：192.168.1.100\n"
    "国际手机号：+8618321019580\n";

class MapReader : public SourceReader {
public:
    explicit MapReader(std::map<std::string, std::string> texts) : texts(std::move(texts)) {}

    std::string read(const std::string& sourceId) const override {
        auto it = texts.find(sourceId);
        if (it == texts.end())
            throw SourceReadFailure(sourceId, "unreadable");
        return it->second;
    }

private:
    std::map<std::string, std::string> texts;
};

// Asks the scanner to stop while reading `trigger`.
class CancellingReader : public SourceReader {
public:
    CancellingReader(Scanner& scanner, std::string trigger) : scanner(scanner), trigger(std::move(trigger)) {}

    std::string read(const std::string& sourceId) const override {
        if (sourceId == trigger)
            scanner.cancel();
        return "13812345678";
    }

private:
    Scanner& scanner;
    std::string trigger;
};

// Finds every 'G' and 'B'; the candidate built at a 'B' carries the wrong
// category, which validate() refuses.
class MixedPattern : public BasePattern {
public:
    std::string name() const override { return "MIXED"; }
    Category category() const override { return Category::PASSWORD; }
    bool match(const std::string& text, size_t offset) const override {
        return text[offset] == 'G' || text[offset] == 'B';
    }
    Candidate parse(const std::string& text, size_t offset) const override {
        Candidate c = makeCandidate(text, offset, offset + 1);
        if (text[offset] == 'B')
            c.category = Category::EMAIL;
        return c;
    }

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig&) const override {
        return makeFinding(candidate, 0.8, candidate.value);
    }
};

}

TEST(ScannerTest, SampleTextAllCategories) {
    Scanner scanner;
    auto report = scanner.scanText("sample", kSampleText, allCategories());

    std::vector<std::pair<Category, std::string>> expected = {
        {Category::PHONE, "13812345678"},
        {Category::LANDLINE, "010-62345678"},
        {Category::ADDRESS, "北京市海淀区中关村南大街5号"},
        {Category::ID_CARD, "110101199003077512"},
        {Category::EMAIL, "zhangsan@example.com"},
        {Category::CREDIT_CARD, "4111111111111111"},
        {Category::PASSWORD, "A**********6"},
        {Category::IP_ADDRESS, "192.168.1.100"},
        {Category::PHONE, "18321019580"},
    };
    ASSERT_EQ(report.findings.size(), expected.size()) << formatBatchReport(BatchReport{{report}, false});
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(report.findings[i].category, expected[i].first) << i;
        EXPECT_EQ(report.findings[i].display, expected[i].second) << i;
    }

    const std::string text = kSampleText;
    for (const auto& f : report.findings) {
        EXPECT_LE(f.end, text.size());
        EXPECT_EQ(text.substr(f.start, f.end - f.start), f.value);
        EXPECT_GE(f.confidence, 0.0);
        EXPECT_LE(f.confidence, 1.0);
    }
}

TEST(ScannerTest, OnlyRequestedCategoriesAreReported) {
    Scanner scanner;
    auto report = scanner.scanText("s", "手机：13812345678 邮箱：a.b@example.com", {Category::PHONE});
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].category, Category::PHONE);
    EXPECT_EQ(report.findings[0].value, "13812345678");
}

TEST(ScannerTest, EmptyTextGivesEmptyReport) {
    Scanner scanner;
    auto report = scanner.scanText("empty", "", allCategories());
    EXPECT_FALSE(report.failed());
    EXPECT_TRUE(report.findings.empty());
}

TEST(ScannerTest, FailedSourceDoesNotStopTheBatch) {
    MapReader reader({{"a.txt", "手机：13812345678"}, {"c.txt", "服务器IP：10.1.2.3"}});
    Scanner scanner;
    BatchReport batch = scanner.scan(std::vector<std::string>{"a.txt", "b.txt", "c.txt"}, reader, allCategories());

    ASSERT_EQ(batch.reports.size(), 3u);
    EXPECT_FALSE(batch.cancelled);

    EXPECT_EQ(batch.reports[0].source, "a.txt");
    EXPECT_FALSE(batch.reports[0].failed());
    ASSERT_EQ(batch.reports[0].findings.size(), 1u);

    EXPECT_EQ(batch.reports[1].source, "b.txt");
    EXPECT_TRUE(batch.reports[1].failed());
    EXPECT_EQ(batch.reports[1].error, "unreadable");
    EXPECT_TRUE(batch.reports[1].findings.empty());

    EXPECT_EQ(batch.reports[2].source, "c.txt");
    EXPECT_FALSE(batch.reports[2].failed());
    ASSERT_EQ(batch.reports[2].findings.size(), 1u);
    EXPECT_EQ(batch.reports[2].findings[0].category, Category::IP_ADDRESS);
}

TEST(ScannerTest, UnknownCategoryFailsWholeCall) {
    Scanner scanner;
    std::vector<Source> sources = {{"a", "13812345678"}};
    std::set<Category> bogus = {static_cast<Category>(42)};
    EXPECT_THROW(scanner.scan(sources, bogus), UnknownCategory);
}

TEST(ScannerTest, RepeatedScansAreIdentical) {
    std::vector<Source> sources;
    for (int i = 0; i < 12; ++i)
        sources.push_back({"source-" + std::to_string(i), std::string(kSampleText) + std::to_string(i)});

    DetectorConfig config;
    config.maxWorkers = 4;
    Scanner scanner(config);
    BatchReport first = scanner.scan(sources, allCategories());
    BatchReport second = scanner.scan(sources, allCategories());

    EXPECT_EQ(formatBatchReport(first, true), formatBatchReport(second, true));
    EXPECT_EQ(batchReportJson(first), batchReportJson(second));
}

TEST(ScannerTest, BatchKeepsSubmissionOrderUnderConcurrency) {
    std::vector<Source> sources;
    for (int i = 0; i < 50; ++i) {
        std::string text = (i % 3 == 0) ? "tel 13812345678" : "nothing here " + std::to_string(i);
        sources.push_back({"s" + std::to_string(i), text});
    }

    DetectorConfig config;
    config.maxWorkers = 8;
    Scanner scanner(config);
    BatchReport batch = scanner.scan(sources, {Category::PHONE});
    ASSERT_EQ(batch.reports.size(), sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        EXPECT_EQ(batch.reports[i].source, sources[i].id);
        EXPECT_EQ(batch.reports[i].findings.size(), i % 3 == 0 ? 1u : 0u);
    }
}

TEST(ScannerTest, CancelAbandonsPendingSources) {
    std::vector<Source> sources = {{"a", "13812345678"}, {"b", "13912345678"}};
    Scanner scanner;
    scanner.cancel();
    BatchReport cancelled = scanner.scan(sources, {Category::PHONE});
    EXPECT_TRUE(cancelled.cancelled);
    EXPECT_TRUE(cancelled.reports.empty());

    // the request is consumed by that batch
    BatchReport next = scanner.scan(sources, {Category::PHONE});
    EXPECT_FALSE(next.cancelled);
    EXPECT_EQ(next.reports.size(), 2u);
}

TEST(ScannerTest, CancelDuringBatchKeepsFinishedSources) {
    DetectorConfig config;
    config.maxWorkers = 1;
    Scanner scanner(config);
    CancellingReader reader(scanner, "a");

    std::vector<std::string> ids = {"a", "b", "c"};
    BatchReport batch = scanner.scan(ids, reader, {Category::PHONE});
    EXPECT_TRUE(batch.cancelled);
    ASSERT_EQ(batch.reports.size(), 1u);
    EXPECT_EQ(batch.reports[0].source, "a");
    EXPECT_EQ(batch.reports[0].findings.size(), 1u);

    BatchReport next = scanner.scan(std::vector<std::string>{"b", "c"}, reader, {Category::PHONE});
    EXPECT_FALSE(next.cancelled);
    EXPECT_EQ(next.reports.size(), 2u);
}

TEST(ScannerTest, CancelAfterBatchCarriesOver) {
    std::vector<Source> sources = {{"a", "13812345678"}};
    Scanner scanner;
    EXPECT_FALSE(scanner.scan(sources, {Category::PHONE}).cancelled);

    scanner.cancel();
    EXPECT_TRUE(scanner.scan(sources, {Category::PHONE}).cancelled);
    EXPECT_FALSE(scanner.scan(sources, {Category::PHONE}).cancelled);
}

TEST(ScannerTest, MalformedCandidateDoesNotLoseTheSource) {
    std::vector<PatternPtr> patterns = {std::make_shared<const MixedPattern>()};
    Scanner scanner;
    ScanReport report = scanner.scanText("mixed", "G B G", patterns);
    EXPECT_FALSE(report.failed());
    ASSERT_EQ(report.findings.size(), 2u);
    EXPECT_EQ(report.findings[0].start, 0u);
    EXPECT_EQ(report.findings[1].start, 4u);
    EXPECT_EQ(report.findings[1].value, "G");
}

TEST(ScannerTest, MinConfidenceFiltersFindings) {
    DetectorConfig config;
    config.minConfidence = 0.8;
    config.contextWindow = 4;
    Scanner scanner(config);
    auto report = scanner.scanText("s", "call 13912345678, tel 13812345678", {Category::PHONE});
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].value, "13812345678");
}
