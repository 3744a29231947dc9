// File: src/cli/pipeline_config.cpp
//
// YAML Configuration Implementation for the floodvi pipeline

#include "cli/pipeline_config.hpp"
#include <yaml.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace floodvi {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Whole-string number; std::stod alone accepts trailing garbage
static double ParseDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("'" + key + "' expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("'" + key + "' expects a number, got '" + value + "'");
    }
    return result;
}

std::optional<PipelineConfig> PipelineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<PipelineConfig> PipelineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    PipelineConfig config = Default();
    std::string current_section;
    std::string current_key;
    std::string error;
    int depth = 0;
    bool in_sequence = false;

    auto apply = [&](const std::string& key, const std::string& value) {
        if (current_section == "inputs") {
            if (key == "dem") config.inputs.dem_path = value;
            else if (key == "boundaries") config.inputs.boundaries_path = value;
            else if (key == "boundaries_layer") config.inputs.boundaries_layer = value;
            else if (key == "socioeconomic") config.inputs.socioeconomic_path = value;
            else if (key == "zone_id_field") config.inputs.zone_id_field = value;
            else if (key == "zone_name_field") config.inputs.zone_name_field = value;
        }
        else if (current_section == "outputs") {
            if (key == "output_dir") config.outputs.output_dir = value;
            else if (key == "geometry_file") config.outputs.geometry_file = value;
            else if (key == "geometry_driver") config.outputs.geometry_driver = value;
            else if (key == "database") config.outputs.database_path = value;
        }
        else if (current_section == "extraction") {
            // A scalar threshold is a one-element list
            if (key == "thresholds") config.extraction.thresholds = {ParseDouble(key, value)};
        }
        else if (current_section == "physical_weights") {
            config.physical_weights[key] = ParseDouble(key, value);
        }
        else if (current_section == "socioeconomic_weights") {
            config.socioeconomic_weights[key] = ParseDouble(key, value);
        }
        else if (current_section == "overall") {
            if (key == "physical_weight") config.overall.physical_weight = ParseDouble(key, value);
            else if (key == "socioeconomic_weight") config.overall.socioeconomic_weight = ParseDouble(key, value);
            else if (key == "neutral_value") config.overall.neutral_value = ParseDouble(key, value);
        }
        else if (current_section == "logging") {
            if (key == "verbose") config.logging.verbose = ParseBool(value);
        }
    };

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " at line " << (parser.problem_mark.line + 1);
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                // An explicit weight section replaces the default weights
                if (depth == 2 && current_section == "physical_weights") {
                    config.physical_weights.clear();
                } else if (depth == 2 && current_section == "socioeconomic_weights") {
                    config.socioeconomic_weights.clear();
                }
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                } else if (depth == 2) {
                    current_key.clear();  // nested mappings are not supported
                }
                break;

            case YAML_SEQUENCE_START_EVENT:
                if (depth == 2 && current_section == "extraction" && current_key == "thresholds") {
                    config.extraction.thresholds.clear();
                    in_sequence = true;
                } else {
                    error = "Unexpected sequence under '" + current_section + "'";
                }
                break;

            case YAML_SEQUENCE_END_EVENT:
                in_sequence = false;
                current_key.clear();
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                try {
                    if (depth == 1) {
                        if (!current_section.empty()) {
                            error = "Section '" + current_section + "' must be a mapping";
                        }
                        current_section = value;
                    } else if (depth == 2 && in_sequence) {
                        config.extraction.thresholds.push_back(ParseDouble(current_key, value));
                    } else if (depth == 2) {
                        if (current_key.empty()) {
                            current_key = value;
                        } else {
                            apply(current_key, value);
                            current_key.clear();
                        }
                    }
                } catch (const std::exception& e) {
                    error = e.what();
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);

        if (!error.empty()) {
            std::cerr << "Invalid configuration: " << error << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& message : config.GetValidationErrors()) {
            std::cerr << "  - " << message << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool PipelineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string PipelineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# floodvi pipeline configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "inputs:\n";
    ss << "  dem: \"" << inputs.dem_path << "\"\n";
    ss << "  boundaries: \"" << inputs.boundaries_path << "\"\n";
    ss << "  boundaries_layer: \"" << inputs.boundaries_layer << "\"\n";
    ss << "  socioeconomic: \"" << inputs.socioeconomic_path << "\"\n";
    ss << "  zone_id_field: \"" << inputs.zone_id_field << "\"\n";
    ss << "  zone_name_field: \"" << inputs.zone_name_field << "\"\n\n";

    ss << "outputs:\n";
    ss << "  output_dir: \"" << outputs.output_dir << "\"\n";
    ss << "  geometry_file: \"" << outputs.geometry_file << "\"\n";
    ss << "  geometry_driver: \"" << outputs.geometry_driver << "\"\n";
    ss << "  database: \"" << outputs.database_path << "\"\n\n";

    ss << "extraction:\n";
    ss << "  thresholds: [";
    for (size_t i = 0; i < extraction.thresholds.size(); ++i) {
        if (i) ss << ", ";
        ss << extraction.thresholds[i];
    }
    ss << "]\n\n";

    ss << "physical_weights:\n";
    for (const auto& [name, weight] : physical_weights) {
        ss << "  " << name << ": " << weight << "\n";
    }
    ss << "\n";

    ss << "socioeconomic_weights:\n";
    for (const auto& [name, weight] : socioeconomic_weights) {
        ss << "  " << name << ": " << weight << "\n";
    }
    ss << "\n";

    ss << "overall:\n";
    ss << "  physical_weight: " << overall.physical_weight << "\n";
    ss << "  socioeconomic_weight: " << overall.socioeconomic_weight << "\n";
    ss << "  neutral_value: " << overall.neutral_value << "\n\n";

    ss << "logging:\n";
    ss << "  verbose: " << (logging.verbose ? "true" : "false") << "\n";

    return ss.str();
}

bool PipelineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> PipelineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (inputs.zone_id_field.empty()) {
        errors.push_back("zone_id_field must not be empty");
    }
    if (outputs.output_dir.empty()) {
        errors.push_back("output_dir must not be empty");
    }
    if (outputs.geometry_file.empty() || outputs.geometry_driver.empty()) {
        errors.push_back("geometry_file and geometry_driver must not be empty");
    }

    // Thresholds
    std::set<std::string> threshold_names;
    for (double t : extraction.thresholds) {
        if (!std::isfinite(t)) {
            errors.push_back("thresholds must be finite numbers");
            continue;
        }
        if (!threshold_names.insert(ThresholdFactorName(t)).second) {
            errors.push_back("duplicate threshold: " + ThresholdFactorName(t));
        }
    }

    // Physical weights
    double physical_total = 0.0;
    for (const auto& [name, weight] : physical_weights) {
        bool known = name == factors::ELEVATION_MEAN || name == factors::ELEVATION_MIN ||
                     name == factors::ELEVATION_MAX || threshold_names.count(name) > 0;
        if (!known) {
            errors.push_back("physical weight '" + name +
                             "' is neither an elevation statistic nor a configured threshold");
        }
        if (!std::isfinite(weight) || weight < 0.0) {
            errors.push_back("physical weight '" + name + "' must be non-negative");
        } else {
            physical_total += weight;
        }
    }
    if (physical_total <= 0.0) {
        errors.push_back("sum of physical weights must be greater than 0");
    }

    // Socioeconomic weights
    std::set<std::string> catalog;
    for (const auto& spec : DefaultSocioeconomicFactors()) {
        catalog.insert(spec.name);
    }
    double socio_total = 0.0;
    for (const auto& [name, weight] : socioeconomic_weights) {
        if (catalog.count(name) == 0) {
            errors.push_back("unknown socioeconomic factor '" + name + "'");
        }
        if (!std::isfinite(weight) || weight < 0.0) {
            errors.push_back("socioeconomic weight '" + name + "' must be non-negative");
        } else {
            socio_total += weight;
        }
    }
    if (socio_total <= 0.0) {
        errors.push_back("sum of socioeconomic weights must be greater than 0");
    }

    // Overall blend
    if (!(overall.physical_weight >= 0.0) || !(overall.socioeconomic_weight >= 0.0)) {
        errors.push_back("overall category weights must be non-negative");
    } else if (overall.physical_weight + overall.socioeconomic_weight <= 0.0) {
        errors.push_back("sum of overall category weights must be greater than 0");
    }
    if (!(overall.neutral_value >= 0.0 && overall.neutral_value <= 100.0)) {
        errors.push_back("neutral_value must be between 0 and 100");
    }

    return errors;
}

std::vector<FactorSpec> PipelineConfig::PhysicalFactors() const {
    std::vector<std::pair<std::string, FactorDirection>> order = {
        {factors::ELEVATION_MEAN, FactorDirection::DESCENDING},
        {factors::ELEVATION_MIN, FactorDirection::DESCENDING},
        {factors::ELEVATION_MAX, FactorDirection::DESCENDING},
    };
    std::vector<double> thresholds = extraction.thresholds;
    std::sort(thresholds.begin(), thresholds.end());
    for (double t : thresholds) {
        order.emplace_back(ThresholdFactorName(t), FactorDirection::ASCENDING);
    }

    std::vector<FactorSpec> specs;
    for (const auto& [name, direction] : order) {
        auto it = physical_weights.find(name);
        if (it != physical_weights.end()) {
            specs.push_back({name, direction, it->second, false});
        }
    }
    return specs;
}

std::vector<FactorSpec> PipelineConfig::SocioeconomicFactors() const {
    std::vector<FactorSpec> specs;
    for (auto spec : DefaultSocioeconomicFactors()) {
        auto it = socioeconomic_weights.find(spec.name);
        if (it != socioeconomic_weights.end()) {
            spec.weight = it->second;
            specs.push_back(spec);
        }
    }
    return specs;
}

ZonalStatsExtractor::Config PipelineConfig::ExtractorConfig() const {
    ZonalStatsExtractor::Config extractor;
    extractor.thresholds = extraction.thresholds;
    return extractor;
}

VulnerabilityAggregator::Config PipelineConfig::AggregatorConfig() const {
    VulnerabilityAggregator::Config aggregator;
    aggregator.physical_factors = PhysicalFactors();
    aggregator.socioeconomic_factors = SocioeconomicFactors();
    aggregator.physical_weight = overall.physical_weight;
    aggregator.socioeconomic_weight = overall.socioeconomic_weight;
    aggregator.neutral_value = overall.neutral_value;
    return aggregator;
}

static std::vector<std::string> WithAliases(const std::string& configured,
                                            std::initializer_list<const char*> aliases) {
    std::vector<std::string> fields;
    if (!configured.empty()) {
        fields.push_back(configured);
    }
    for (const char* alias : aliases) {
        if (std::find(fields.begin(), fields.end(), alias) == fields.end()) {
            fields.emplace_back(alias);
        }
    }
    return fields;
}

std::vector<std::string> PipelineConfig::ZoneIdFields() const {
    return WithAliases(inputs.zone_id_field, {"zone_id", "ward_id"});
}

std::vector<std::string> PipelineConfig::ZoneNameFields() const {
    return WithAliases(inputs.zone_name_field, {"zone_name", "ward_name"});
}

PipelineConfig PipelineConfig::Default() {
    return PipelineConfig{};  // Uses default member initializers
}

} // namespace floodvi
