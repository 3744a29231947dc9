// File: src/cli/floodvi_cli.hpp
//
// floodvi command-line front end
// Extracted from main() for testability

#ifndef FLOODVI_CLI_HPP
#define FLOODVI_CLI_HPP

#include "cli/pipeline_config.hpp"
#include "pipeline/providers.hpp"
#include "pipeline/vulnerability_pipeline.hpp"
#include "raster/coordinate_transformer.hpp"
#include "storage/result_sink.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace floodvi {

/// Process exit codes
namespace ExitCode {
    inline constexpr int OK = 0;
    inline constexpr int USAGE = 1;          // Bad arguments, invalid config, unwritable output
    inline constexpr int JOIN_FAILED = 2;    // Tables written, geometry join failed
    inline constexpr int ABORTED = 3;        // Neither category could be computed
}

/// Command-line interface:
///
///   floodvi run [--config f] [--dem f] [--boundaries f] [--socioeconomic f]
///               [--output-dir d] [--database f] [--verbose]
///   floodvi config [--output f]
///   floodvi show --database f [--zone id]
///
/// Format adapters are injected so the command logic runs without GDAL.
class FloodviCli {
public:
    /// Builds format-specific collaborators from the effective configuration
    struct Adapters {
        std::function<std::unique_ptr<SurfaceProvider>(const PipelineConfig&)> surface;
        std::function<std::unique_ptr<BoundaryProvider>(const PipelineConfig&)> boundaries;

        /// Spatial output; may be empty
        std::function<std::unique_ptr<ResultSink>(const PipelineConfig&)> geometry_sink;

        /// May be empty
        CoordinateTransformerFactory transformer_factory;
    };

    FloodviCli(Adapters adapters, std::ostream& out, std::ostream& err);

    /// Execute one command
    /// @param args Arguments without the program name
    /// @return Process exit code (see ExitCode)
    int Execute(const std::vector<std::string>& args);

    /// Usage text
    static std::string Usage();

    /// Report of the last "run" command, if any
    const std::optional<RunReport>& last_report() const { return last_report_; }

private:
    int RunCommand(const std::vector<std::string>& args);
    int ConfigCommand(const std::vector<std::string>& args);
    int ShowCommand(const std::vector<std::string>& args);

    void PrintSummary(const RunReport& report) const;

    Adapters adapters_;
    std::ostream& out_;
    std::ostream& err_;
    std::optional<RunReport> last_report_;
};

} // namespace floodvi

#endif // FLOODVI_CLI_HPP
