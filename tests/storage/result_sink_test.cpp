// File: tests/storage/result_sink_test.cpp
#include "storage/memory_result_sink.hpp"
#include "storage/result_sink.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace floodvi {
namespace {

/// Counts calls and optionally fails every write
class CountingSink : public ResultSink {
public:
    explicit CountingSink(bool fail, std::string message = "disk full")
        : fail_(fail), message_(std::move(message)) {}

    void WriteCategory(const CategoryResult&) override { Hit(); }
    void WriteOverall(const std::vector<OverallIndex>&) override { Hit(); }
    void WriteJoined(const std::vector<JoinedZone>&, const std::string&) override { Hit(); }
    void Flush() override { Hit(); }

    int calls() const { return calls_; }

private:
    void Hit() {
        ++calls_;
        if (fail_) {
            throw std::runtime_error(message_);
        }
    }

    bool fail_;
    std::string message_;
    int calls_{0};
};

std::vector<OverallIndex> OneRow() {
    OverallIndex row;
    row.zone_id = "W01";
    row.physical = 60.0;
    row.socioeconomic = 40.0;
    row.overall = 52.0;
    return {row};
}

// ============================================================================
// MemoryResultSink
// ============================================================================

TEST(MemoryResultSinkTest, KeepsLatestArtifacts) {
    MemoryResultSink sink;
    EXPECT_FALSE(sink.physical().has_value());

    CategoryResult physical;
    physical.category = Category::PHYSICAL;
    CategoryResult socio;
    socio.category = Category::SOCIOECONOMIC;
    sink.WriteCategory(physical);
    sink.WriteCategory(socio);
    sink.WriteOverall(OneRow());
    sink.WriteJoined({}, "EPSG:32643");
    sink.Flush();

    EXPECT_TRUE(sink.physical().has_value());
    EXPECT_TRUE(sink.socioeconomic().has_value());
    ASSERT_TRUE(sink.overall().has_value());
    EXPECT_EQ(1u, sink.overall()->size());
    EXPECT_TRUE(sink.joined().has_value());
    EXPECT_EQ("EPSG:32643", sink.joined_crs());
    EXPECT_EQ(1u, sink.flush_count());

    sink.Clear();
    EXPECT_FALSE(sink.overall().has_value());
    EXPECT_EQ(0u, sink.flush_count());
}

// ============================================================================
// CompositeResultSink
// ============================================================================

TEST(CompositeResultSinkTest, FansOutToEveryChild) {
    auto first = std::make_unique<MemoryResultSink>();
    auto second = std::make_unique<MemoryResultSink>();
    MemoryResultSink* a = first.get();
    MemoryResultSink* b = second.get();

    CompositeResultSink sink;
    sink.Add(std::move(first));
    sink.Add(std::move(second));
    EXPECT_EQ(2u, sink.size());

    sink.WriteOverall(OneRow());
    sink.Flush();

    EXPECT_TRUE(a->overall().has_value());
    EXPECT_TRUE(b->overall().has_value());
    EXPECT_EQ(1u, b->flush_count());
}

TEST(CompositeResultSinkTest, FailureDoesNotStopLaterChildren) {
    auto failing = std::make_unique<CountingSink>(true, "cannot write overall");
    auto memory = std::make_unique<MemoryResultSink>();
    CountingSink* f = failing.get();
    MemoryResultSink* m = memory.get();

    CompositeResultSink sink;
    sink.Add(std::move(failing));
    sink.Add(std::move(memory));

    try {
        sink.WriteOverall(OneRow());
        FAIL() << "expected the child failure to propagate";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ("cannot write overall", e.what());
    }
    EXPECT_EQ(1, f->calls());
    EXPECT_TRUE(m->overall().has_value());
}

TEST(CompositeResultSinkTest, FirstErrorWins) {
    CompositeResultSink sink;
    sink.Add(std::make_unique<CountingSink>(true, "first"));
    sink.Add(std::make_unique<CountingSink>(true, "second"));
    try {
        sink.Flush();
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ("first", e.what());
    }
}

TEST(CompositeResultSinkTest, RejectsNullChild) {
    CompositeResultSink sink;
    EXPECT_THROW(sink.Add(nullptr), std::invalid_argument);
}

TEST(CompositeResultSinkTest, EmptyCompositeAcceptsWrites) {
    CompositeResultSink sink;
    EXPECT_NO_THROW(sink.WriteOverall(OneRow()));
    EXPECT_NO_THROW(sink.Flush());
}

} // namespace
} // namespace floodvi
