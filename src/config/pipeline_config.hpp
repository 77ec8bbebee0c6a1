#pragma once
#include "../calc/position_calculator.hpp"
#include "../core/errors.hpp"
#include "../io/recording_schema.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Which positions the grid is laid over
 */
enum class GridSource {
    ESTIMATES = 0,  ///< Positions computed for the magnetic samples
    REFERENCE       ///< Ground-truth positions
};

/**
 * @brief One recording input: where it is and how its columns are named
 */
struct RecordingSource {
    std::string path;
    RecordingSchema schema;
};

/**
 * @brief Configuration of one analysis run
 *
 * Every key is optional. Defaults follow the layout of the IPS
 * recordings export and grid over the computed positions with 1x1 cells.
 */
struct PipelineConfig {
    std::string name{"recording"};
    RecordingSource magnetics{"", RecordingSchema::magnetics_default()};
    RecordingSource positions{"", RecordingSchema::positions_default()};
    char delimiter{','};
    nlohmann::json mapping;                     ///< Strategy description, see make_mapping_strategy()
    PositionCalculatorOptions calculator{1.0, UnalignedPolicy::SKIP};
    double cell_width{1.0};
    double cell_height{1.0};
    GridSource grid_source{GridSource::ESTIMATES};
    std::string estimates_csv;                  ///< Empty: not written
    std::string grid_json;                      ///< Empty: not written
    std::string publish_endpoint;               ///< Empty: not published

    /**
     * @brief Build a configuration from JSON
     * @throws ConfigError on values of the wrong type or out of range
     */
    static PipelineConfig from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw ConfigError("config", "configuration must be a JSON object");
        }
        PipelineConfig c;
        try {
            c.name = j.value("name", c.name);

            auto read_source = [&j](const char* key, RecordingKind kind, RecordingSource& src) {
                if (!j.contains(key)) return;
                const auto& s = j[key];
                if (!s.is_object()) {
                    throw ConfigError(key, "expected an object with 'path' and 'schema'");
                }
                src.path = s.value("path", src.path);
                src.schema = RecordingSchema::from_json(s.value("schema", nlohmann::json()), kind);
            };
            read_source("magnetics", RecordingKind::MAGNETIC, c.magnetics);
            read_source("positions", RecordingKind::POSITIONAL, c.positions);

            std::string delim = j.value("delimiter", std::string(1, c.delimiter));
            if (delim.size() != 1) {
                throw ConfigError("delimiter", "delimiter must be a single character");
            }
            c.delimiter = delim[0];

            if (j.contains("mapping")) c.mapping = j["mapping"];

            c.calculator.tolerance = j.value("tolerance", c.calculator.tolerance);
            if (!(c.calculator.tolerance >= 0.0)) {
                throw ConfigError("tolerance", "tolerance must be >= 0");
            }

            std::string unaligned = j.value("unaligned", std::string("skip"));
            if (unaligned == "skip") c.calculator.unaligned = UnalignedPolicy::SKIP;
            else if (unaligned == "fail") c.calculator.unaligned = UnalignedPolicy::FAIL;
            else throw ConfigError("unaligned", "expected 'skip' or 'fail'");

            if (j.contains("cell_size")) {
                const auto& cs = j["cell_size"];
                if (!cs.is_array() || cs.size() != 2 || !cs[0].is_number() || !cs[1].is_number()) {
                    throw ConfigError("cell_size", "expected [width, height]");
                }
                c.cell_width = cs[0].get<double>();
                c.cell_height = cs[1].get<double>();
            }

            std::string source = j.value("grid_source", std::string("estimates"));
            if (source == "estimates") c.grid_source = GridSource::ESTIMATES;
            else if (source == "reference") c.grid_source = GridSource::REFERENCE;
            else throw ConfigError("grid_source", "expected 'estimates' or 'reference'");

            if (j.contains("output")) {
                const auto& out = j["output"];
                c.estimates_csv = out.value("estimates_csv", c.estimates_csv);
                c.grid_json = out.value("grid_json", c.grid_json);
            }
            c.publish_endpoint = j.value("publish_endpoint", c.publish_endpoint);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("config", e.what());
        }
        return c;
    }

    /**
     * @brief Parse a configuration document
     * @throws ConfigError if the text is not valid JSON
     */
    static PipelineConfig parse(const std::string& text) {
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded()) {
            throw ConfigError("config", "configuration is not valid JSON");
        }
        return from_json(j);
    }

    /**
     * @brief Load a configuration file
     * @throws RecordingIoError if the file cannot be read
     */
    static PipelineConfig load(const std::string& path) {
        std::ifstream f(path);
        if (!f) {
            throw RecordingIoError(path, "cannot open configuration");
        }
        std::stringstream ss;
        ss << f.rdbuf();
        return parse(ss.str());
    }
};
