#pragma once
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include "rect_grid.hpp"
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Mean magnetic field magnitude per grid cell
 *
 * Cells that received no sample hold NaN. Storage is row-major, rows along y.
 */
struct MagneticGridMap {
    RectGrid grid;
    std::vector<std::size_t> counts;
    std::vector<double> mean_magnitude;
    std::size_t outside{0};   ///< Estimates that fell outside the grid and were ignored

    std::size_t count_at(const GridCell& c) const { return counts[grid.flat_index(c)]; }
    double mean_at(const GridCell& c) const { return mean_magnitude[grid.flat_index(c)]; }

    std::size_t occupied_cells() const {
        std::size_t n = 0;
        for (auto c : counts) {
            if (c > 0) ++n;
        }
        return n;
    }

    /**
     * @brief Grid geometry plus per-cell counts and means (NaN as null)
     */
    nlohmann::json to_json() const {
        nlohmann::json mean = nlohmann::json::array();
        nlohmann::json count = nlohmann::json::array();
        for (std::size_t r = 0; r < grid.rows; ++r) {
            nlohmann::json mean_row = nlohmann::json::array();
            nlohmann::json count_row = nlohmann::json::array();
            for (std::size_t c = 0; c < grid.columns; ++c) {
                std::size_t i = grid.flat_index(GridCell{r, c});
                if (std::isnan(mean_magnitude[i])) mean_row.push_back(nullptr);
                else mean_row.push_back(mean_magnitude[i]);
                count_row.push_back(counts[i]);
            }
            mean.push_back(mean_row);
            count.push_back(count_row);
        }
        return {
            {"origin", {grid.origin_x, grid.origin_y}},
            {"cell_size", {grid.cell_width, grid.cell_height}},
            {"columns", grid.columns},
            {"rows", grid.rows},
            {"occupied_cells", occupied_cells()},
            {"outside", outside},
            {"counts", count},
            {"mean_magnitude", mean}
        };
    }
};

/**
 * @brief Average |B| of the magnetic samples behind the estimates into grid cells
 *
 * @param grid Grid to fill
 * @param estimates Estimates whose sample_index refers into `magnetic`
 * @param magnetic Magnetic recording the estimates were derived from
 * @throws MalformedRecordingError if an estimate refers to a sample that
 *         does not exist or carries no field vector
 * @throws InvalidCellSizeError if the grid is empty or exceeds kMaxGridCells
 */
inline MagneticGridMap build_magnetic_grid_map(const RectGrid& grid,
                                               const std::vector<PositionEstimate>& estimates,
                                               const Recording& magnetic) {
    if (grid.columns == 0 || grid.rows == 0 || grid.columns > kMaxGridCells / grid.rows) {
        throw InvalidCellSizeError(grid.cell_width, grid.cell_height,
                                   "grid has " + std::to_string(grid.columns) + " x " +
                                   std::to_string(grid.rows) + " cells");
    }
    MagneticGridMap map;
    map.grid = grid;
    map.counts.assign(grid.cell_count(), 0);
    std::vector<double> sums(grid.cell_count(), 0.0);

    for (const auto& e : estimates) {
        if (e.sample_index >= magnetic.size() || !magnetic[e.sample_index].field) {
            throw MalformedRecordingError(magnetic.name, "estimate refers to sample " +
                                          std::to_string(e.sample_index) +
                                          " which has no field vector");
        }
        if (!grid.contains(e.x, e.y)) {
            ++map.outside;
            continue;
        }
        std::size_t i = grid.flat_index(grid.cell_of(e.x, e.y));
        sums[i] += magnetic[e.sample_index].field->magnitude();
        ++map.counts[i];
    }

    map.mean_magnitude.assign(grid.cell_count(), std::numeric_limits<double>::quiet_NaN());
    for (std::size_t i = 0; i < sums.size(); ++i) {
        if (map.counts[i] > 0) {
            map.mean_magnitude[i] = sums[i] / static_cast<double>(map.counts[i]);
        }
    }
    return map;
}
