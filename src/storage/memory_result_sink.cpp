// File: src/storage/memory_result_sink.cpp
#include "storage/memory_result_sink.hpp"

namespace floodvi {

void MemoryResultSink::WriteCategory(const CategoryResult& result) {
    if (result.category == Category::PHYSICAL) {
        physical_ = result;
    } else {
        socioeconomic_ = result;
    }
}

void MemoryResultSink::WriteOverall(const std::vector<OverallIndex>& overall) {
    overall_ = overall;
}

void MemoryResultSink::WriteJoined(const std::vector<JoinedZone>& joined, const std::string& crs) {
    joined_ = joined;
    joined_crs_ = crs;
}

void MemoryResultSink::Flush() {
    ++flush_count_;
}

void MemoryResultSink::Clear() {
    physical_.reset();
    socioeconomic_.reset();
    overall_.reset();
    joined_.reset();
    joined_crs_.clear();
    flush_count_ = 0;
}

} // namespace floodvi
