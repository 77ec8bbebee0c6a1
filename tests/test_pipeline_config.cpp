#include "../src/config/pipeline_config.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * @brief Test run configuration parsing
 */
int main() {
    std::cout << "Testing PipelineConfig..." << std::endl;

    // Test 1: Defaults
    {
        std::cout << "Test 1: Defaults" << std::endl;

        PipelineConfig c = PipelineConfig::parse("{}");
        assert(c.name == "recording");
        assert(c.delimiter == ',');
        assert(c.mapping.is_null());
        assert(c.calculator.tolerance == 1.0);
        assert(c.calculator.unaligned == UnalignedPolicy::SKIP);
        assert(c.cell_width == 1.0 && c.cell_height == 1.0);
        assert(c.grid_source == GridSource::ESTIMATES);
        assert(c.magnetics.schema.column_for(Field::MAG_X) == "x");
        assert(c.positions.schema.column_for(Field::FLOOR) == "floor");
        assert(c.estimates_csv.empty() && c.grid_json.empty());
        assert(c.publish_endpoint.empty());

        std::cout << "  Defaults test passed" << std::endl;
    }

    // Test 2: Full document
    {
        std::cout << "Test 2: Full configuration" << std::endl;

        const std::string text = R"({
            "name": "10732",
            "magnetics": {"path": "m.csv", "schema": {"timestamp": "time", "mag_x": "bx"}},
            "positions": {"path": "p.csv"},
            "delimiter": ";",
            "mapping": {"kind": "nearest_neighbor"},
            "tolerance": 0.25,
            "unaligned": "fail",
            "cell_size": [5, 2.5],
            "grid_source": "reference",
            "output": {"estimates_csv": "e.csv", "grid_json": "g.json"},
            "publish_endpoint": "tcp://127.0.0.1:5557"
        })";
        PipelineConfig c = PipelineConfig::parse(text);
        assert(c.name == "10732");
        assert(c.magnetics.path == "m.csv");
        assert(c.magnetics.schema.column_for(Field::TIMESTAMP) == "time");
        assert(c.magnetics.schema.column_for(Field::MAG_X) == "bx");
        assert(c.magnetics.schema.column_for(Field::MAG_Y) == "y");
        assert(c.positions.path == "p.csv");
        assert(c.positions.schema.kind == RecordingKind::POSITIONAL);
        assert(c.delimiter == ';');
        assert(c.mapping["kind"] == "nearest_neighbor");
        assert(c.calculator.tolerance == 0.25);
        assert(c.calculator.unaligned == UnalignedPolicy::FAIL);
        assert(c.cell_width == 5.0 && c.cell_height == 2.5);
        assert(c.grid_source == GridSource::REFERENCE);
        assert(c.estimates_csv == "e.csv");
        assert(c.grid_json == "g.json");
        assert(c.publish_endpoint == "tcp://127.0.0.1:5557");

        std::cout << "  Full configuration test passed" << std::endl;
    }

    // Test 3: Invalid documents
    {
        std::cout << "Test 3: Invalid configurations" << std::endl;

        auto rejects = [](const std::string& text, const std::string& subject) {
            try {
                PipelineConfig::parse(text);
            } catch (const ConfigError& e) {
                return e.subject() == subject;
            }
            return false;
        };

        assert(rejects("not json", "config"));
        assert(rejects("[1, 2]", "config"));
        assert(rejects(R"({"delimiter": ",,"})", "delimiter"));
        assert(rejects(R"({"tolerance": -1})", "tolerance"));
        assert(rejects(R"({"tolerance": "wide"})", "config"));
        assert(rejects(R"({"unaligned": "maybe"})", "unaligned"));
        assert(rejects(R"({"cell_size": [1]})", "cell_size"));
        assert(rejects(R"({"cell_size": ["a", 1]})", "cell_size"));
        assert(rejects(R"({"grid_source": "magnetics"})", "grid_source"));
        assert(rejects(R"({"magnetics": "m.csv"})", "magnetics"));
        assert(rejects(R"({"magnetics": {"schema": {"mag_q": "q"}}})", "schema.mag_q"));
        assert(rejects(R"({"positions": {"schema": {"y": ""}}})", "schema.y"));

        std::cout << "  Invalid configuration test passed" << std::endl;
    }

    // Test 4: Missing configuration file
    {
        std::cout << "Test 4: Missing file" << std::endl;

        bool threw = false;
        try {
            PipelineConfig::load("/nonexistent/config.json");
        } catch (const RecordingIoError& e) {
            threw = e.kind() == ErrorKind::RECORDING_IO;
        }
        assert(threw);

        std::cout << "  Missing file test passed" << std::endl;
    }

    std::cout << "✅ All PipelineConfig tests passed!" << std::endl;
    return 0;
}
