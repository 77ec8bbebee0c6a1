#pragma once
#include "../core/sample.hpp"
#include "alignment.hpp"
#include <array>
#include <functional>
#include <string>
#include <utility>

/**
 * @brief Abstract magnetic-to-planar mapping
 *
 * The position calculator aligns every magnetic sample against the reference
 * recording in the way the strategy asks for, then hands the sample and the
 * aligned reference samples to map(). Strategies are stateless with respect
 * to the samples they map; the same instance may be reused across
 * recordings.
 */
class IMappingStrategy {
public:
    /**
     * @brief Strategy variants
     */
    enum class Kind {
        NEAREST_NEIGHBOR = 0,   ///< Position of the nearest reference sample
        LINEAR_INTERPOLATION,   ///< Constant velocity between ground truths
        LINEAR_CALIBRATION,     ///< Affine model of the field vector
        QUADRATIC_CALIBRATION,  ///< Second-order model of the field vector
        CUSTOM                  ///< Caller-supplied function
    };

    /**
     * @brief Reference lookup a strategy needs before map()
     */
    enum class AlignmentMode {
        NONE = 0,   ///< No reference needed
        NEAREST,    ///< Nearest reference sample within tolerance
        BRACKET     ///< Enclosing reference segment within the widened range
    };

    virtual ~IMappingStrategy() = default;

    /**
     * @brief Map one aligned magnetic sample to planar coordinates
     */
    virtual PlanarPoint map(const Sample& magnetic, const AlignedReference& ref) const = 0;

    virtual Kind kind() const = 0;

    virtual AlignmentMode alignment_mode() const = 0;

    bool requires_reference() const {
        return alignment_mode() != AlignmentMode::NONE;
    }

    virtual std::string name() const {
        return kind_to_string(kind());
    }

    /**
     * @brief Stable configuration name of a strategy kind
     */
    static std::string kind_to_string(Kind kind) {
        switch (kind) {
            case Kind::NEAREST_NEIGHBOR: return "nearest_neighbor";
            case Kind::LINEAR_INTERPOLATION: return "linear_interpolation";
            case Kind::LINEAR_CALIBRATION: return "linear_calibration";
            case Kind::QUADRATIC_CALIBRATION: return "quadratic_calibration";
            case Kind::CUSTOM: return "custom";
            default: return "invalid";
        }
    }
};

/**
 * @brief Takes the position of the reference sample nearest in time
 */
class NearestNeighborStrategy : public IMappingStrategy {
public:
    PlanarPoint map(const Sample&, const AlignedReference& ref) const override {
        return *ref.nearest->position;
    }
    Kind kind() const override { return Kind::NEAREST_NEIGHBOR; }
    AlignmentMode alignment_mode() const override { return AlignmentMode::NEAREST; }
};

/**
 * @brief Interpolates between consecutive ground-truth positions
 *
 * Walking speed is taken as constant between two consecutive ground truths:
 *   x = x_i + (t - t_i) * (x_{i+1} - x_i) / (t_{i+1} - t_i)
 * and likewise for y. Before the first ground truth the first segment is
 * extended. A zero-length segment yields the later point. Reference samples
 * must carry positions; compute_positions() checks this.
 */
class LinearInterpolationStrategy : public IMappingStrategy {
public:
    PlanarPoint map(const Sample& magnetic, const AlignedReference& ref) const override {
        const PlanarPoint p0 = *ref.lower->position;
        const PlanarPoint p1 = *ref.upper->position;
        const double dt = ref.upper->t - ref.lower->t;
        if (dt <= 0.0) return p1;

        const double speed_x = (p1.x - p0.x) / dt;
        const double speed_y = (p1.y - p0.y) / dt;
        const double elapsed = magnetic.t - ref.lower->t;
        return PlanarPoint{p0.x + elapsed * speed_x, p0.y + elapsed * speed_y};
    }
    Kind kind() const override { return Kind::LINEAR_INTERPOLATION; }
    AlignmentMode alignment_mode() const override { return AlignmentMode::BRACKET; }
};

/**
 * @brief x = c0 + c1*mx + c2*my + c3*mz (same form for y)
 */
class LinearCalibrationStrategy : public IMappingStrategy {
public:
    using Coefficients = std::array<double, 4>;

private:
    Coefficients cx_;
    Coefficients cy_;

public:
    LinearCalibrationStrategy(const Coefficients& cx, const Coefficients& cy)
        : cx_(cx), cy_(cy) {}

    PlanarPoint map(const Sample& magnetic, const AlignedReference&) const override {
        const MagneticField m = magnetic.field.value_or(MagneticField{});
        return PlanarPoint{
            cx_[0] + cx_[1] * m.mx + cx_[2] * m.my + cx_[3] * m.mz,
            cy_[0] + cy_[1] * m.mx + cy_[2] * m.my + cy_[3] * m.mz
        };
    }
    Kind kind() const override { return Kind::LINEAR_CALIBRATION; }
    AlignmentMode alignment_mode() const override { return AlignmentMode::NONE; }

    const Coefficients& x_coefficients() const { return cx_; }
    const Coefficients& y_coefficients() const { return cy_; }
};

/**
 * @brief Second-order calibration model
 *
 * Feature order: 1, mx, my, mz, mx², my², mz², mx·my, mx·mz, my·mz
 */
class QuadraticCalibrationStrategy : public IMappingStrategy {
public:
    using Coefficients = std::array<double, 10>;

private:
    Coefficients cx_;
    Coefficients cy_;

    static std::array<double, 10> features(const MagneticField& m) {
        return {1.0, m.mx, m.my, m.mz,
                m.mx * m.mx, m.my * m.my, m.mz * m.mz,
                m.mx * m.my, m.mx * m.mz, m.my * m.mz};
    }

public:
    QuadraticCalibrationStrategy(const Coefficients& cx, const Coefficients& cy)
        : cx_(cx), cy_(cy) {}

    PlanarPoint map(const Sample& magnetic, const AlignedReference&) const override {
        const auto f = features(magnetic.field.value_or(MagneticField{}));
        PlanarPoint p;
        for (std::size_t i = 0; i < f.size(); ++i) {
            p.x += cx_[i] * f[i];
            p.y += cy_[i] * f[i];
        }
        return p;
    }
    Kind kind() const override { return Kind::QUADRATIC_CALIBRATION; }
    AlignmentMode alignment_mode() const override { return AlignmentMode::NONE; }
};

/**
 * @brief Wraps a caller-supplied mapping function
 */
class CustomMappingStrategy : public IMappingStrategy {
public:
    using MapFn = std::function<PlanarPoint(const Sample&, const AlignedReference&)>;

private:
    MapFn fn_;
    AlignmentMode mode_;
    std::string name_;

public:
    CustomMappingStrategy(MapFn fn, AlignmentMode mode, std::string name = "custom")
        : fn_(std::move(fn)), mode_(mode), name_(std::move(name)) {}

    PlanarPoint map(const Sample& magnetic, const AlignedReference& ref) const override {
        return fn_(magnetic, ref);
    }
    Kind kind() const override { return Kind::CUSTOM; }
    AlignmentMode alignment_mode() const override { return mode_; }
    std::string name() const override { return name_; }
};
