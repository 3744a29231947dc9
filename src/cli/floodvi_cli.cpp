// File: src/cli/floodvi_cli.cpp
//
// floodvi command-line front end

#include "cli/floodvi_cli.hpp"
#include "core/errors.hpp"
#include "storage/csv_result_sink.hpp"
#include "storage/result_store.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace floodvi {

namespace {

/// Parsed "--name value" options and "--flag" switches
struct ParsedOptions {
    std::map<std::string, std::string> values;
    std::set<std::string> flags;
    std::string error;

    bool Has(const std::string& name) const { return values.count(name) > 0; }
    const std::string& Get(const std::string& name) const { return values.at(name); }
};

ParsedOptions ParseOptions(const std::vector<std::string>& args, size_t start,
                           const std::set<std::string>& value_options,
                           const std::set<std::string>& flag_options) {
    ParsedOptions parsed;
    for (size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (flag_options.count(arg) > 0) {
            parsed.flags.insert(arg);
        } else if (value_options.count(arg) > 0) {
            if (i + 1 >= args.size()) {
                parsed.error = "Option " + arg + " requires a value";
                return parsed;
            }
            parsed.values[arg] = args[++i];
        } else {
            parsed.error = "Unknown argument: " + arg;
            return parsed;
        }
    }
    return parsed;
}

std::string FormatScore(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

std::string RunLabel() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

FloodviCli::FloodviCli(Adapters adapters, std::ostream& out, std::ostream& err)
    : adapters_(std::move(adapters)), out_(out), err_(err) {}

std::string FloodviCli::Usage() {
    return
        "Usage:\n"
        "  floodvi run [--config FILE] [--dem FILE] [--boundaries FILE]\n"
        "              [--socioeconomic FILE] [--output-dir DIR] [--database FILE] [--verbose]\n"
        "      Compute physical, socioeconomic and overall flood vulnerability.\n"
        "  floodvi config [--output FILE]\n"
        "      Print (or write) the default configuration as YAML.\n"
        "  floodvi show --database FILE [--zone ID]\n"
        "      Print the overall index of the latest archived run.\n"
        "\n"
        "Exit codes: 0 success, 1 usage/config/output error,\n"
        "            2 geometry join failed, 3 no category could be computed\n";
}

int FloodviCli::Execute(const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        out_ << Usage();
        return args.empty() ? ExitCode::USAGE : ExitCode::OK;
    }

    const std::string& command = args[0];
    if (command == "run") return RunCommand(args);
    if (command == "config") return ConfigCommand(args);
    if (command == "show") return ShowCommand(args);

    err_ << "Unknown command: " << command << "\n\n" << Usage();
    return ExitCode::USAGE;
}

// ============================================================================
// run
// ============================================================================

int FloodviCli::RunCommand(const std::vector<std::string>& args) {
    ParsedOptions options = ParseOptions(
        args, 1,
        {"--config", "--dem", "--boundaries", "--socioeconomic", "--output-dir", "--database"},
        {"--verbose"});
    if (!options.error.empty()) {
        err_ << options.error << "\n\n" << Usage();
        return ExitCode::USAGE;
    }

    // A file is validated while loading; its errors go to std::cerr
    std::optional<PipelineConfig> loaded = options.Has("--config")
        ? PipelineConfig::LoadFromFile(options.Get("--config"))
        : std::optional<PipelineConfig>(PipelineConfig::Default());
    if (!loaded.has_value()) {
        err_ << "Could not load configuration\n";
        return ExitCode::USAGE;
    }
    PipelineConfig config = *loaded;

    // Command-line overrides
    if (options.Has("--dem")) config.inputs.dem_path = options.Get("--dem");
    if (options.Has("--boundaries")) config.inputs.boundaries_path = options.Get("--boundaries");
    if (options.Has("--socioeconomic")) config.inputs.socioeconomic_path = options.Get("--socioeconomic");
    if (options.Has("--output-dir")) config.outputs.output_dir = options.Get("--output-dir");
    if (options.Has("--database")) config.outputs.database_path = options.Get("--database");
    if (options.flags.count("--verbose") > 0) config.logging.verbose = true;

    // Overrides can still empty a required setting
    if (!config.Validate()) {
        err_ << "Configuration validation failed:\n";
        for (const auto& error : config.GetValidationErrors()) {
            err_ << "  - " << error << "\n";
        }
        return ExitCode::USAGE;
    }
    if (!adapters_.surface || !adapters_.boundaries) {
        err_ << "No raster/vector input support in this build\n";
        return ExitCode::USAGE;
    }

    std::unique_ptr<SurfaceProvider> surface;
    std::unique_ptr<BoundaryProvider> boundaries;
    CompositeResultSink sink;
    try {
        surface = adapters_.surface(config);
        boundaries = adapters_.boundaries(config);

        CsvResultSink::Config csv;
        csv.output_dir = config.outputs.output_dir;
        sink.Add(std::make_unique<CsvResultSink>(csv));

        if (adapters_.geometry_sink) {
            sink.Add(adapters_.geometry_sink(config));
        }

        if (!config.outputs.database_path.empty()) {
            ResultStore::Config store_config;
            store_config.db_path = config.outputs.database_path;
            auto store = std::make_unique<ResultStore>(store_config);
            int64_t run_id = store->BeginRun(RunLabel());
            if (config.logging.verbose) {
                out_ << "[floodvi] Archiving as run " << run_id << " in "
                     << config.outputs.database_path << "\n";
            }
            sink.Add(std::move(store));
        }
    } catch (const std::exception& e) {
        err_ << "Cannot prepare outputs: " << e.what() << "\n";
        return ExitCode::USAGE;
    }

    CsvSocioeconomicProvider::Config socio_config;
    socio_config.path = config.inputs.socioeconomic_path;
    socio_config.id_columns = config.ZoneIdFields();
    socio_config.name_columns = config.ZoneNameFields();
    CsvSocioeconomicProvider socioeconomic(socio_config);

    VulnerabilityPipeline::Config pipeline_config;
    pipeline_config.extraction = config.ExtractorConfig();
    pipeline_config.aggregation = config.AggregatorConfig();
    pipeline_config.verbose = config.logging.verbose;

    VulnerabilityPipeline pipeline(pipeline_config, *surface, *boundaries, socioeconomic,
                                   sink, adapters_.transformer_factory);

    try {
        last_report_ = pipeline.Run();
    } catch (const MissingInputError& e) {
        err_ << "Run aborted: " << e.what() << "\n";
        return ExitCode::ABORTED;
    } catch (const std::invalid_argument& e) {
        err_ << "Invalid input: " << e.what() << "\n";
        return ExitCode::USAGE;
    }

    PrintSummary(*last_report_);

    if (last_report_->join_error.has_value()) {
        return ExitCode::JOIN_FAILED;
    }
    if (!last_report_->sink_errors.empty()) {
        return ExitCode::USAGE;
    }
    return ExitCode::OK;
}

void FloodviCli::PrintSummary(const RunReport& report) const {
    out_ << "Flood vulnerability computed for " << report.overall.size() << " zones\n";
    out_ << "  physical:      " << (report.physical ? "computed" : "unavailable (neutral value used)") << "\n";
    out_ << "  socioeconomic: " << (report.socioeconomic ? "computed" : "unavailable (neutral value used)") << "\n";
    if (!report.degraded.empty()) {
        out_ << "  degraded zones: " << report.degraded.size() << "\n";
    }

    // Five most vulnerable zones
    std::vector<const OverallIndex*> ranked;
    for (const auto& row : report.overall) {
        ranked.push_back(&row);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const OverallIndex* a, const OverallIndex* b) {
        return a->overall > b->overall;
    });
    size_t shown = std::min<size_t>(5, ranked.size());
    if (shown > 0) {
        out_ << "  most vulnerable:\n";
        for (size_t i = 0; i < shown; ++i) {
            out_ << "    " << std::left << std::setw(12) << ranked[i]->zone_id << std::right
                 << FormatScore(ranked[i]->overall) << "\n";
        }
    }

    if (report.join_error.has_value()) {
        out_ << "  geometry output skipped: " << *report.join_error << "\n";
    }
    for (const auto& error : report.sink_errors) {
        out_ << "  output failed: " << error << "\n";
    }
}

// ============================================================================
// config
// ============================================================================

int FloodviCli::ConfigCommand(const std::vector<std::string>& args) {
    ParsedOptions options = ParseOptions(args, 1, {"--output"}, {});
    if (!options.error.empty()) {
        err_ << options.error << "\n\n" << Usage();
        return ExitCode::USAGE;
    }

    PipelineConfig config = PipelineConfig::Default();
    if (options.Has("--output")) {
        if (!config.SaveToFile(options.Get("--output"))) {
            err_ << "Failed to write " << options.Get("--output") << "\n";
            return ExitCode::USAGE;
        }
        out_ << "Default configuration written to " << options.Get("--output") << "\n";
    } else {
        out_ << config.ToYamlString();
    }
    return ExitCode::OK;
}

// ============================================================================
// show
// ============================================================================

int FloodviCli::ShowCommand(const std::vector<std::string>& args) {
    ParsedOptions options = ParseOptions(args, 1, {"--database", "--zone"}, {});
    if (!options.error.empty() || !options.Has("--database")) {
        err_ << (options.error.empty() ? "show requires --database" : options.error)
             << "\n\n" << Usage();
        return ExitCode::USAGE;
    }

    const std::string& path = options.Get("--database");
    if (!std::filesystem::exists(path)) {
        err_ << "No such database: " << path << "\n";
        return ExitCode::USAGE;
    }

    try {
        ResultStore::Config store_config;
        store_config.db_path = path;
        ResultStore store(store_config);

        auto run_id = store.LatestRunId();
        if (!run_id.has_value()) {
            err_ << "Database holds no runs: " << path << "\n";
            return ExitCode::USAGE;
        }

        std::vector<OverallIndex> overall = store.LoadOverall(*run_id);
        if (options.Has("--zone")) {
            const std::string zone = CanonicalZoneId(options.Get("--zone"));
            auto it = std::find_if(overall.begin(), overall.end(),
                                   [&](const OverallIndex& row) { return row.zone_id == zone; });
            if (it == overall.end()) {
                err_ << "Zone " << zone << " not found in run " << *run_id << "\n";
                return ExitCode::USAGE;
            }
            overall = {*it};
        }

        out_ << "Run " << *run_id << "\n";
        out_ << std::left << std::setw(12) << "zone_id" << std::right
             << std::setw(10) << "physical" << std::setw(15) << "socioeconomic"
             << std::setw(10) << "overall" << "\n";
        for (const auto& row : overall) {
            out_ << std::left << std::setw(12) << row.zone_id << std::right
                 << std::setw(10) << (FormatScore(row.physical) + (row.physical_fallback ? "*" : ""))
                 << std::setw(15) << (FormatScore(row.socioeconomic) + (row.socioeconomic_fallback ? "*" : ""))
                 << std::setw(10) << FormatScore(row.overall) << "\n";
        }
        bool any_fallback = std::any_of(overall.begin(), overall.end(), [](const OverallIndex& row) {
            return row.physical_fallback || row.socioeconomic_fallback;
        });
        if (any_fallback) {
            out_ << "* neutral value substituted\n";
        }
    } catch (const std::exception& e) {
        err_ << "Cannot read " << path << ": " << e.what() << "\n";
        return ExitCode::USAGE;
    }
    return ExitCode::OK;
}

} // namespace floodvi
