// File: src/pipeline/providers.cpp
#include "pipeline/providers.hpp"
#include "core/errors.hpp"
#include <filesystem>

namespace floodvi {

CsvSocioeconomicProvider::CsvSocioeconomicProvider(const Config& config)
    : config_(config) {}

SourceFactorTable CsvSocioeconomicProvider::Load(const std::vector<FactorSpec>& specs) {
    if (config_.path.empty() || !std::filesystem::exists(config_.path)) {
        throw MissingInputError(config_.path, "Socioeconomic table not found",
                                Category::SOCIOECONOMIC);
    }

    DataTable source;
    try {
        source = ReadCsvFile(config_.path);
    } catch (const std::runtime_error& e) {
        throw MissingInputError(config_.path, e.what(), Category::SOCIOECONOMIC);
    }

    return BuildFactorTable(source, specs, config_.id_columns, config_.name_columns, config_.path);
}

} // namespace floodvi
