// File: src/storage/result_sink.cpp
#include "storage/result_sink.hpp"
#include <stdexcept>
#include <utility>

namespace floodvi {

void CompositeResultSink::Add(std::unique_ptr<ResultSink> sink) {
    if (!sink) {
        throw std::invalid_argument("Cannot register a null result sink");
    }
    sinks_.push_back(std::move(sink));
}

template <typename Fn>
void CompositeResultSink::ForEach(Fn&& fn) {
    std::string first_error;
    for (auto& sink : sinks_) {
        try {
            fn(*sink);
        } catch (const std::exception& e) {
            if (first_error.empty()) {
                first_error = e.what();
            }
        }
    }
    if (!first_error.empty()) {
        throw std::runtime_error(first_error);
    }
}

void CompositeResultSink::WriteCategory(const CategoryResult& result) {
    ForEach([&](ResultSink& sink) { sink.WriteCategory(result); });
}

void CompositeResultSink::WriteOverall(const std::vector<OverallIndex>& overall) {
    ForEach([&](ResultSink& sink) { sink.WriteOverall(overall); });
}

void CompositeResultSink::WriteJoined(const std::vector<JoinedZone>& joined,
                                      const std::string& crs) {
    ForEach([&](ResultSink& sink) { sink.WriteJoined(joined, crs); });
}

void CompositeResultSink::Flush() {
    ForEach([](ResultSink& sink) { sink.Flush(); });
}

} // namespace floodvi
