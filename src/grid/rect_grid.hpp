#pragma once
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief (row, column) index of a grid cell
 *
 * Rows run along y, columns along x, both from the grid origin.
 */
struct GridCell {
    std::size_t row{0};
    std::size_t column{0};

    bool operator==(const GridCell& o) const { return row == o.row && column == o.column; }
};

/**
 * @brief Regular rectangular lattice anchored at (origin_x, origin_y)
 */
struct RectGrid {
    double origin_x{0.0};
    double origin_y{0.0};
    double cell_width{1.0};
    double cell_height{1.0};
    std::size_t columns{1};
    std::size_t rows{1};

    double width() const { return static_cast<double>(columns) * cell_width; }
    double height() const { return static_cast<double>(rows) * cell_height; }
    std::size_t cell_count() const { return columns * rows; }

    /**
     * @brief Whether (x, y) lies in the closed rectangle the grid covers
     */
    bool contains(double x, double y) const {
        return x >= origin_x && x <= origin_x + width() &&
               y >= origin_y && y <= origin_y + height();
    }

    /**
     * @brief Cell containing (x, y)
     *
     * floor((x - origin_x) / cell_width) clamped to [0, columns - 1], same
     * for rows, so points on the far edges land in the last column/row.
     */
    GridCell cell_of(double x, double y) const {
        return GridCell{clamp_index((y - origin_y) / cell_height, rows),
                        clamp_index((x - origin_x) / cell_width, columns)};
    }

    /**
     * @brief Row-major flat index of a cell
     */
    std::size_t flat_index(const GridCell& c) const {
        return c.row * columns + c.column;
    }

    bool operator==(const RectGrid& o) const {
        return origin_x == o.origin_x && origin_y == o.origin_y &&
               cell_width == o.cell_width && cell_height == o.cell_height &&
               columns == o.columns && rows == o.rows;
    }

    static std::size_t clamp_index(double v, std::size_t count) {
        double f = std::floor(v);
        if (!(f > 0.0)) return 0;  // also catches NaN
        if (f >= static_cast<double>(count - 1)) return count - 1;
        return static_cast<std::size_t>(f);
    }
};

/// Largest number of cells build_rect_grid() lays out
constexpr std::size_t kMaxGridCells = std::size_t{1} << 26;

namespace detail {

/**
 * @brief ceil(extent / cell), at least 1, grown until origin + n*cell reaches max
 * @return 0 if the extent is not finite or needs more than kMaxGridCells cells
 */
inline std::size_t cells_to_cover(double min, double max, double cell) {
    const double n = std::ceil((max - min) / cell);
    if (!std::isfinite(n) || n > static_cast<double>(kMaxGridCells)) return 0;
    std::size_t count = n < 1.0 ? 1 : static_cast<std::size_t>(n);
    while (min + static_cast<double>(count) * cell < max) ++count;
    return count;
}

} // namespace detail

/**
 * @brief Lay a grid of cell_width x cell_height cells over the estimates
 *
 * The origin is the lower-left corner of the estimates' bounding box.
 *
 * @throws EmptyInputError when estimates is empty
 * @throws InvalidCellSizeError when a cell dimension is not strictly positive,
 *         or the extent needs more than kMaxGridCells cells
 */
inline RectGrid build_rect_grid(const std::vector<PositionEstimate>& estimates,
                                double cell_width, double cell_height) {
    if (estimates.empty()) {
        throw EmptyInputError("estimates");
    }
    if (!(cell_width > 0.0) || !(cell_height > 0.0) ||
        !std::isfinite(cell_width) || !std::isfinite(cell_height)) {
        throw InvalidCellSizeError(cell_width, cell_height);
    }

    auto [min_x, max_x] = std::minmax_element(estimates.begin(), estimates.end(),
        [](const PositionEstimate& a, const PositionEstimate& b) { return a.x < b.x; });
    auto [min_y, max_y] = std::minmax_element(estimates.begin(), estimates.end(),
        [](const PositionEstimate& a, const PositionEstimate& b) { return a.y < b.y; });

    RectGrid grid;
    grid.origin_x = min_x->x;
    grid.origin_y = min_y->y;
    grid.cell_width = cell_width;
    grid.cell_height = cell_height;
    grid.columns = detail::cells_to_cover(min_x->x, max_x->x, cell_width);
    grid.rows = detail::cells_to_cover(min_y->y, max_y->y, cell_height);
    if (grid.columns == 0 || grid.rows == 0 || grid.columns > kMaxGridCells / grid.rows) {
        throw InvalidCellSizeError(cell_width, cell_height,
                                   "grid over the estimates would exceed " +
                                   std::to_string(kMaxGridCells) + " cells");
    }
    return grid;
}

/**
 * @brief Cell of every estimate, in estimate order
 */
inline std::vector<GridCell> assign_cells(const RectGrid& grid,
                                          const std::vector<PositionEstimate>& estimates) {
    std::vector<GridCell> cells;
    cells.reserve(estimates.size());
    for (const auto& e : estimates) {
        cells.push_back(grid.cell_of(e.x, e.y));
    }
    return cells;
}

/**
 * @brief Treat ground-truth samples as estimates so a grid can cover them
 */
inline std::vector<PositionEstimate> estimates_from_reference(const Recording& positional) {
    std::vector<PositionEstimate> out;
    out.reserve(positional.size());
    for (std::size_t i = 0; i < positional.size(); ++i) {
        const Sample& s = positional[i];
        if (!s.position) continue;
        out.push_back(PositionEstimate{i, s.t, s.position->x, s.position->y});
    }
    return out;
}
