// File: src/cli/floodvi_main.cpp
//
// floodvi entry point: wires the GDAL/OGR adapters into the CLI

#include "cli/floodvi_cli.hpp"
#include "io/gdal_surface_provider.hpp"
#include "io/ogr_boundary_provider.hpp"
#include "io/ogr_coordinate_transformer.hpp"
#include "io/ogr_geometry_sink.hpp"
#include <filesystem>
#include <iostream>

using namespace floodvi;

int main(int argc, char** argv) {
    FloodviCli::Adapters adapters;

    adapters.surface = [](const PipelineConfig& config) -> std::unique_ptr<SurfaceProvider> {
        GdalSurfaceProvider::Config surface;
        surface.path = config.inputs.dem_path;
        return std::make_unique<GdalSurfaceProvider>(surface);
    };

    adapters.boundaries = [](const PipelineConfig& config) -> std::unique_ptr<BoundaryProvider> {
        OgrBoundaryProvider::Config boundaries;
        boundaries.path = config.inputs.boundaries_path;
        boundaries.layer = config.inputs.boundaries_layer;
        boundaries.id_fields = config.ZoneIdFields();
        boundaries.name_fields = config.ZoneNameFields();
        return std::make_unique<OgrBoundaryProvider>(boundaries);
    };

    adapters.geometry_sink = [](const PipelineConfig& config) -> std::unique_ptr<ResultSink> {
        OgrGeometrySink::Config sink;
        sink.path = (std::filesystem::path(config.outputs.output_dir) /
                     config.outputs.geometry_file).string();
        sink.driver = config.outputs.geometry_driver;
        return std::make_unique<OgrGeometrySink>(sink);
    };

    adapters.transformer_factory = MakeOgrTransformerFactory();

    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        FloodviCli cli(adapters, std::cout, std::cerr);
        return cli.Execute(args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return ExitCode::USAGE;
    }
}
