#include "../src/session/recording_session.hpp"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Test a full recording session: load, positions, grid, outputs
 *
 * Ground truth walks (0,0) -> (2,4) -> (6,4) over t = 0, 2, 4.
 * The last magnetic sample is recorded after the walk ended.
 */

namespace fs = std::filesystem;

namespace {

const char* kPositions =
    "t,x,y,floor,type,accuracy\n"
    "0,0,0,1,0,0.5\n"
    "2,2,4,1,0,0.5\n"
    "4,6,4,1,0,\n";

const char* kMagnetics =
    "t,x,y,z,accuracy\n"
    "0.5,3,4,0,3\n"
    "1.0,0,0,2,3\n"
    "2.5,1,2,2,3\n"
    "3.0,0,0,5,3\n"
    "5.5,1,0,0,3\n";

fs::path write_file(const std::string& name, const std::string& text) {
    fs::path p = fs::temp_directory_path() / ("ips_session_" + name);
    std::ofstream f(p);
    f << text;
    return p;
}

std::string read_file(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

PipelineConfig default_config() {
    PipelineConfig c;
    c.name = "walk";
    c.magnetics.path = write_file("magnetics.csv", kMagnetics).string();
    c.positions.path = write_file("positions.csv", kPositions).string();
    return c;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

} // namespace

int main() {
    std::cout << "Testing RecordingSession..." << std::endl;

    // Test 1: Reading both recordings
    {
        std::cout << "Test 1: Read recordings" << std::endl;

        RecordingSession session(default_config());
        std::vector<std::string> messages;
        session.set_log_callback([&messages](const std::string& m) { messages.push_back(m); });
        session.load();

        assert(session.magnetics()->size() == 5);
        assert(session.positions()->size() == 3);
        assert(session.magnetics()->kind == RecordingKind::MAGNETIC);
        assert(session.positions()->kind == RecordingKind::POSITIONAL);
        assert(session.positions()->samples[1].floor == 1);
        assert(!session.positions()->samples[2].accuracy);
        assert(session.magnetics()->samples[0].field->magnitude() == 5.0);
        assert(messages.size() == 2);
        assert(!session.position_result());

        std::cout << "  Read recordings test passed" << std::endl;
    }

    // Test 2: Positions at constant velocity between ground truths
    {
        std::cout << "Test 2: Magnetic positions" << std::endl;

        RecordingSession session(default_config());
        session.load();
        const PositionResult& r = session.compute_positions();

        // Sample after the last ground truth is discarded
        assert(r.estimates.size() == 4);
        assert((r.skipped == std::vector<std::size_t>{4}));

        // First estimate = first ground truth + elapsed time * speed
        const auto& gt = session.positions()->samples;
        const double dt = session.magnetics()->samples[0].t - gt[0].t;
        const double vx = (gt[1].position->x - gt[0].position->x) / (gt[1].t - gt[0].t);
        const double vy = (gt[1].position->y - gt[0].position->y) / (gt[1].t - gt[0].t);
        assert(near(r.estimates[0].x, gt[0].position->x + dt * vx));
        assert(near(r.estimates[0].y, gt[0].position->y + dt * vy));

        assert(near(r.estimates[1].x, 1.0) && near(r.estimates[1].y, 2.0));
        assert(near(r.estimates[2].x, 3.0) && near(r.estimates[2].y, 4.0));
        assert(near(r.estimates[3].x, 4.0) && near(r.estimates[3].y, 4.0));

        std::cout << "  Magnetic positions test passed" << std::endl;
    }

    // Test 3: Rectangular grid over the estimates
    {
        std::cout << "Test 3: Rectangular grid" << std::endl;

        RecordingSession session(default_config());
        session.load();
        const MagneticGridMap& map = session.set_rect_grid(1.0, 1.0);  // computes positions first

        assert(session.position_result());
        assert(map.grid.origin_x == 0.5 && map.grid.origin_y == 1.0);
        assert(map.grid.columns == 4 && map.grid.rows == 3);
        assert(map.mean_at({0, 0}) == 5.0);
        assert(map.mean_at({1, 0}) == 2.0);
        assert(map.mean_at({2, 2}) == 3.0);   // top edge goes into the last row
        assert(map.mean_at({2, 3}) == 5.0);
        assert(std::isnan(map.mean_at({0, 3})));
        assert(map.occupied_cells() == 4);

        // A new grid replaces the old one
        const MagneticGridMap& coarse = session.set_rect_grid(10.0, 10.0);
        assert(coarse.grid.cell_count() == 1);
        assert(coarse.count_at({0, 0}) == 4);
        assert(near(coarse.mean_at({0, 0}), 15.0 / 4.0));

        // Recomputing positions invalidates the grid
        session.compute_positions();
        assert(!session.grid_map());

        bool threw = false;
        try {
            session.set_rect_grid(0.0, 1.0);
        } catch (const InvalidCellSizeError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  Rectangular grid test passed" << std::endl;
    }

    // Test 4: Grid extent from the ground truth
    {
        std::cout << "Test 4: Grid over ground truth" << std::endl;

        PipelineConfig c = default_config();
        c.grid_source = GridSource::REFERENCE;
        RecordingSession session(c);
        const MagneticGridMap& map = session.run();

        assert(map.grid.origin_x == 0.0 && map.grid.origin_y == 0.0);
        assert(map.grid.columns == 6 && map.grid.rows == 4);
        assert(map.outside == 0);
        assert(map.mean_at({1, 0}) == 5.0);
        assert(map.mean_at({2, 1}) == 2.0);

        std::cout << "  Ground truth grid test passed" << std::endl;
    }

    // Test 5: Summary and output files
    {
        std::cout << "Test 5: Summary and outputs" << std::endl;

        PipelineConfig c = default_config();
        c.estimates_csv = (fs::temp_directory_path() / "ips_session_estimates.csv").string();
        c.grid_json = (fs::temp_directory_path() / "ips_session_grid.json").string();
        RecordingSession session(c);
        session.run();
        session.write_outputs();

        auto s = session.summary();
        assert(s["name"] == "walk");
        assert(s["mapping"] == "linear_interpolation");
        assert(s["magnetics"]["samples"] == 5);
        assert(s["magnetics"]["kind"] == "magnetic");
        assert(s["positions"]["duration"] == 4.0);
        assert(s["positions"]["mean_rate"] == 0.5);
        assert(s["estimates"] == 4);
        assert(s["skipped"] == 1);
        assert(s["grid"]["columns"] == 4);

        std::string csv = read_file(c.estimates_csv);
        assert(csv.rfind("index,t,x,y\n0,0.5,0.5,1\n", 0) == 0);

        auto grid = nlohmann::json::parse(read_file(c.grid_json));
        assert(grid == s["grid"]);

        // Unwritable output
        c.estimates_csv = "/nonexistent/dir/estimates.csv";
        RecordingSession bad(c);
        bad.run();
        bool threw = false;
        try {
            bad.write_outputs();
        } catch (const RecordingIoError& e) {
            threw = e.subject() == c.estimates_csv;
        }
        assert(threw);

        std::cout << "  Summary and output test passed" << std::endl;
    }

    // Test 6: Custom strategy without ground truth
    {
        std::cout << "Test 6: Custom strategy" << std::endl;

        PipelineConfig c = default_config();
        c.positions.path.clear();
        auto strategy = std::make_unique<CustomMappingStrategy>(
            [](const Sample& m, const AlignedReference&) {
                return PlanarPoint{m.t, m.field->magnitude()};
            },
            IMappingStrategy::AlignmentMode::NONE, "time_magnitude");
        RecordingSession session(c, std::move(strategy));
        session.run();

        assert(!session.positions());
        assert(session.position_result()->estimates.size() == 5);
        assert(session.position_result()->skipped.empty());
        assert(session.summary()["mapping"] == "time_magnitude");

        // Interpolation without ground truth cannot align
        RecordingSession lin(c);
        lin.load();
        bool threw = false;
        try {
            lin.compute_positions();
        } catch (const AlignmentError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  Custom strategy test passed" << std::endl;
    }

    // Test 7: Load failures propagate
    {
        std::cout << "Test 7: Load failures" << std::endl;

        PipelineConfig missing = default_config();
        missing.positions.path = "/nonexistent/positions.csv";
        bool threw = false;
        try {
            RecordingSession session(missing);
            session.load();
        } catch (const RecordingIoError& e) {
            threw = e.subject() == missing.positions.path;
        }
        assert(threw);

        PipelineConfig malformed = default_config();
        malformed.magnetics.path =
            write_file("malformed.csv", "t,x,y,z,accuracy\n0.5,3,4\n").string();
        threw = false;
        try {
            RecordingSession session(malformed);
            session.load();
        } catch (const MalformedRecordingError&) {
            threw = true;
        }
        assert(threw);

        PipelineConfig empty = default_config();
        empty.positions.path = write_file("empty.csv", "t,x,y,floor,type,accuracy\n").string();
        RecordingSession session(empty);
        threw = false;
        try {
            session.load();
        } catch (const EmptyRecordingError&) {
            threw = true;
        }
        assert(threw);
        assert(!session.magnetics());

        std::cout << "  Load failure test passed" << std::endl;
    }

    std::cout << "✅ All RecordingSession tests passed!" << std::endl;
    return 0;
}
