// File: src/storage/memory_result_sink.hpp
#pragma once

#include "storage/result_sink.hpp"
#include <optional>

namespace floodvi {

/// Keeps the latest copy of every artifact in memory.
///
/// Used when results are consumed in-process, and as the recording sink
/// in tests.
class MemoryResultSink : public ResultSink {
public:
    MemoryResultSink() = default;

    void WriteCategory(const CategoryResult& result) override;
    void WriteOverall(const std::vector<OverallIndex>& overall) override;
    void WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) override;
    void Flush() override;

    const std::optional<CategoryResult>& physical() const { return physical_; }
    const std::optional<CategoryResult>& socioeconomic() const { return socioeconomic_; }
    const std::optional<std::vector<OverallIndex>>& overall() const { return overall_; }
    const std::optional<std::vector<JoinedZone>>& joined() const { return joined_; }
    const std::string& joined_crs() const { return joined_crs_; }

    /// Number of Flush() calls
    size_t flush_count() const { return flush_count_; }

    /// Forget everything received so far
    void Clear();

private:
    std::optional<CategoryResult> physical_;
    std::optional<CategoryResult> socioeconomic_;
    std::optional<std::vector<OverallIndex>> overall_;
    std::optional<std::vector<JoinedZone>> joined_;
    std::string joined_crs_;
    size_t flush_count_{0};
};

} // namespace floodvi
