#pragma once
#include "../calc/mapping_factory.hpp"
#include "../calc/position_calculator.hpp"
#include "../config/pipeline_config.hpp"
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include "../grid/magnetic_grid_map.hpp"
#include "../grid/rect_grid.hpp"
#include "../io/recording_loader.hpp"
#include "../io/recording_writer.hpp"
#include <exception>
#include <fstream>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief One IPS recording: ground truth, magnetics and their derived products
 *
 * Runs the analysis steps of a recording pair:
 * 1. load() reads the magnetic and positional recordings (concurrently)
 * 2. compute_positions() derives a position for each magnetic sample
 * 3. set_rect_grid() lays a grid over the positions and averages |B| per cell
 *
 * Each step replaces the products of the later steps, so estimates and the
 * grid never outlive the recordings they were computed from.
 */
class RecordingSession {
private:
    PipelineConfig config_;
    std::unique_ptr<IMappingStrategy> strategy_;

    std::optional<Recording> magnetics_;
    std::optional<Recording> positions_;
    std::optional<PositionResult> positions_result_;
    std::optional<MagneticGridMap> grid_map_;

    std::function<void(const std::string&)> log_callback_;

    void log(const std::string& message) const {
        if (log_callback_) log_callback_(message);
    }

public:
    /**
     * @brief Create a session; the mapping strategy is built from the config
     * @throws ConfigError if the mapping description is invalid
     */
    explicit RecordingSession(PipelineConfig config)
        : config_(std::move(config))
        , strategy_(make_mapping_strategy(config_.mapping)) {}

    /**
     * @brief Create a session with a strategy supplied in code (e.g. custom)
     */
    RecordingSession(PipelineConfig config, std::unique_ptr<IMappingStrategy> strategy)
        : config_(std::move(config))
        , strategy_(std::move(strategy)) {}

    /**
     * @brief Receive progress messages
     */
    void set_log_callback(std::function<void(const std::string&)> callback) {
        log_callback_ = std::move(callback);
    }

    /**
     * @brief Load both recordings from the configured paths
     *
     * The two files are read concurrently. The positional recording is
     * optional for calibration strategies: an empty path skips it.
     *
     * @throws RecordingIoError, MalformedRecordingError, EmptyRecordingError
     */
    void load() {
        const char delim = config_.delimiter;
        auto mag_future = std::async(std::launch::async, [this, delim]() {
            return load_recording(config_.magnetics.path, config_.magnetics.schema, delim);
        });
        std::optional<std::future<Recording>> pos_future;
        if (!config_.positions.path.empty()) {
            pos_future = std::async(std::launch::async, [this, delim]() {
                return load_recording(config_.positions.path, config_.positions.schema, delim);
            });
        }

        // Join both loads before rethrowing so no task outlives the session
        std::optional<Recording> mag;
        std::optional<Recording> pos;
        std::exception_ptr failure;
        try {
            mag = mag_future.get();
        } catch (const IpsError&) {
            failure = std::current_exception();
        }
        if (pos_future) {
            try {
                pos = pos_future->get();
            } catch (const IpsError&) {
                if (!failure) failure = std::current_exception();
            }
        }
        if (failure) std::rethrow_exception(failure);

        set_recordings(std::move(*mag), std::move(pos));
        log("Loaded " + std::to_string(magnetics_->size()) + " magnetic samples from " +
            magnetics_->name);
        if (positions_) {
            log("Loaded " + std::to_string(positions_->size()) + " ground-truth positions from " +
                positions_->name);
        }
    }

    /**
     * @brief Use recordings loaded elsewhere; clears derived products
     */
    void set_recordings(Recording magnetics, std::optional<Recording> positions) {
        magnetics_ = std::move(magnetics);
        positions_ = std::move(positions);
        positions_result_.reset();
        grid_map_.reset();
    }

    /**
     * @brief Derive positions for the magnetic samples
     * @throws AlignmentError, EmptyRecordingError
     */
    const PositionResult& compute_positions() {
        if (!magnetics_) {
            throw EmptyRecordingError(config_.magnetics.path.empty() ? config_.name
                                                                    : config_.magnetics.path);
        }
        const Recording* reference = positions_ ? &*positions_ : nullptr;
        positions_result_ = ::compute_positions(*magnetics_, reference, *strategy_,
                                                config_.calculator);
        grid_map_.reset();
        log("Computed " + std::to_string(positions_result_->estimates.size()) +
            " positions with " + strategy_->name() + " (" +
            std::to_string(positions_result_->skipped.size()) + " samples skipped)");
        return *positions_result_;
    }

    /**
     * @brief Grid the positions and average the field magnitude per cell
     *
     * The grid extent comes from the computed positions or, with
     * GridSource::REFERENCE, from the ground truth.
     *
     * @throws EmptyInputError, InvalidCellSizeError
     */
    const MagneticGridMap& set_rect_grid(double cell_width, double cell_height) {
        if (!positions_result_) {
            compute_positions();
        }
        std::vector<PositionEstimate> extent;
        if (config_.grid_source == GridSource::REFERENCE && positions_) {
            extent = estimates_from_reference(*positions_);
        }
        const auto& basis = extent.empty() ? positions_result_->estimates : extent;

        RectGrid grid = build_rect_grid(basis, cell_width, cell_height);
        grid_map_ = build_magnetic_grid_map(grid, positions_result_->estimates, *magnetics_);
        log("Grid " + std::to_string(grid.columns) + " x " + std::to_string(grid.rows) +
            " cells, " + std::to_string(grid_map_->occupied_cells()) + " occupied");
        return *grid_map_;
    }

    /**
     * @brief set_rect_grid() with the configured cell size
     */
    const MagneticGridMap& set_rect_grid() {
        return set_rect_grid(config_.cell_width, config_.cell_height);
    }

    /**
     * @brief Run load, position computation and gridding in order
     */
    const MagneticGridMap& run() {
        load();
        compute_positions();
        return set_rect_grid();
    }

    /**
     * @brief Write the configured output files, if any
     * @throws RecordingIoError if an output cannot be opened
     */
    void write_outputs() const {
        if (!config_.estimates_csv.empty() && positions_result_) {
            std::ofstream f(config_.estimates_csv);
            if (!f) throw RecordingIoError(config_.estimates_csv, "cannot write estimates");
            write_estimates(f, positions_result_->estimates);
            log("Wrote estimates to " + config_.estimates_csv);
        }
        if (!config_.grid_json.empty() && grid_map_) {
            std::ofstream f(config_.grid_json);
            if (!f) throw RecordingIoError(config_.grid_json, "cannot write grid");
            f << grid_map_->to_json().dump(2) << '\n';
            log("Wrote grid to " + config_.grid_json);
        }
    }

    /**
     * @brief JSON summary of everything computed so far
     */
    nlohmann::json summary() const {
        auto stats_json = [](const Recording& rec) {
            const RecordingStats s = rec.stats();
            return nlohmann::json{
                {"kind", recording_kind_to_string(rec.kind)},
                {"samples", s.sample_count},
                {"first_t", s.first_t},
                {"last_t", s.last_t},
                {"duration", s.duration},
                {"mean_rate", s.mean_rate}
            };
        };
        nlohmann::json j = {{"name", config_.name}, {"mapping", strategy_->name()}};
        if (magnetics_) j["magnetics"] = stats_json(*magnetics_);
        if (positions_) j["positions"] = stats_json(*positions_);
        if (positions_result_) {
            j["estimates"] = positions_result_->estimates.size();
            j["skipped"] = positions_result_->skipped.size();
        }
        if (grid_map_) j["grid"] = grid_map_->to_json();
        return j;
    }

    const PipelineConfig& config() const { return config_; }
    const IMappingStrategy& strategy() const { return *strategy_; }
    const std::optional<Recording>& magnetics() const { return magnetics_; }
    const std::optional<Recording>& positions() const { return positions_; }
    const std::optional<PositionResult>& position_result() const { return positions_result_; }
    const std::optional<MagneticGridMap>& grid_map() const { return grid_map_; }
};
