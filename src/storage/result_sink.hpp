// File: src/storage/result_sink.hpp
#pragma once

#include "scoring/vulnerability_aggregator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace floodvi {

/// Abstract destination for pipeline results
///
/// A run hands each artifact to the sink as soon as it exists: the two
/// category tables, the overall table and the geometry-joined collection.
/// Concrete sinks write delimited text, spatial files or database rows, or
/// simply retain the results in memory.
///
/// Failures are reported by throwing (std::runtime_error for I/O). The
/// pipeline records a failed write and carries on with the next artifact.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    /// Persist one category: raw factors, normalized factors and index
    virtual void WriteCategory(const CategoryResult& result) = 0;

    /// Persist the overall index table
    virtual void WriteOverall(const std::vector<OverallIndex>& overall) = 0;

    /// Persist zone geometry with attached indices
    /// @param crs Coordinate reference of the zone geometry
    virtual void WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) = 0;

    /// Complete any buffered output
    virtual void Flush() = 0;
};

/// Fans every write out to several sinks in registration order.
///
/// Every child sees every write even when an earlier child throws; the
/// first failure is rethrown afterwards with the failing child's message.
class CompositeResultSink : public ResultSink {
public:
    CompositeResultSink() = default;

    /// Register a child sink (owned)
    void Add(std::unique_ptr<ResultSink> sink);

    size_t size() const { return sinks_.size(); }

    void WriteCategory(const CategoryResult& result) override;
    void WriteOverall(const std::vector<OverallIndex>& overall) override;
    void WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) override;
    void Flush() override;

private:
    template <typename Fn>
    void ForEach(Fn&& fn);

    std::vector<std::unique_ptr<ResultSink>> sinks_;
};

} // namespace floodvi
