#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Magnetic field vector as reported by the phone magnetometer
 */
struct MagneticField {
    double mx{0.0};  ///< Field along device x axis
    double my{0.0};  ///< Field along device y axis
    double mz{0.0};  ///< Field along device z axis

    /**
     * @brief Euclidean magnitude sqrt(mx² + my² + mz²)
     */
    double magnitude() const {
        return std::sqrt(mx * mx + my * my + mz * mz);
    }
};

/**
 * @brief Point in the recording's planar coordinate frame
 */
struct PlanarPoint {
    double x{0.0};
    double y{0.0};
};

/**
 * @brief Recorded fields a column can carry
 *
 * The order here is the canonical column order used when a recording has
 * no header to reproduce.
 */
enum class Field {
    TIMESTAMP = 0,
    MAG_X,
    MAG_Y,
    MAG_Z,
    X,
    Y,
    FLOOR,
    TYPE,
    ACCURACY
};

inline std::string field_to_string(Field f) {
    switch (f) {
        case Field::TIMESTAMP: return "timestamp";
        case Field::MAG_X: return "mag_x";
        case Field::MAG_Y: return "mag_y";
        case Field::MAG_Z: return "mag_z";
        case Field::X: return "x";
        case Field::Y: return "y";
        case Field::FLOOR: return "floor";
        case Field::TYPE: return "type";
        case Field::ACCURACY: return "accuracy";
        default: return "unknown";
    }
}

/**
 * @brief One recorded observation
 *
 * Magnetic recordings fill `field`, ground-truth (positional) recordings fill
 * `position`. The remaining attributes are carried through when the source
 * has them.
 */
struct Sample {
    double t{0.0};                          ///< Timestamp in recording time units
    std::optional<MagneticField> field;     ///< Magnetometer reading
    std::optional<PlanarPoint> position;    ///< Ground-truth position
    std::optional<double> accuracy;         ///< Sensor-reported accuracy
    std::optional<int> floor;               ///< Building floor of a ground-truth fix
    std::optional<int> type;                ///< Ground-truth fix type

    std::string to_string() const {
        char buffer[256];
        int n = std::snprintf(buffer, sizeof(buffer), "Sample{t=%.6f", t);
        if (field && n > 0 && n < static_cast<int>(sizeof(buffer))) {
            n += std::snprintf(buffer + n, sizeof(buffer) - n, ", m=(%.4f,%.4f,%.4f)",
                               field->mx, field->my, field->mz);
        }
        if (position && n > 0 && n < static_cast<int>(sizeof(buffer))) {
            n += std::snprintf(buffer + n, sizeof(buffer) - n, ", pos=(%.4f,%.4f)",
                               position->x, position->y);
        }
        return std::string(buffer) + "}";
    }
};

/**
 * @brief What a recording was loaded as
 */
enum class RecordingKind {
    MAGNETIC = 0,  ///< Magnetometer samples
    POSITIONAL     ///< Ground-truth positions
};

inline std::string recording_kind_to_string(RecordingKind kind) {
    return kind == RecordingKind::MAGNETIC ? "magnetic" : "positional";
}

/**
 * @brief Summary statistics of a recording
 */
struct RecordingStats {
    std::size_t sample_count{0};
    double first_t{0.0};
    double last_t{0.0};
    double duration{0.0};
    double mean_rate{0.0};   ///< Samples per time unit, 0 when duration is 0
};

/**
 * @brief Ordered sequence of samples loaded from one source
 *
 * Samples are sorted by non-decreasing timestamp. `columns` lists the fields
 * found in the source header together with their header names, in source
 * order, so the recording can be written back with the same layout.
 */
struct Recording {
    std::string name;
    RecordingKind kind{RecordingKind::MAGNETIC};
    std::vector<Sample> samples;
    std::vector<std::pair<Field, std::string>> columns;

    std::size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

    const Sample& operator[](std::size_t i) const { return samples[i]; }

    /**
     * @brief First timestamp (recording must be non-empty)
     */
    double start_time() const { return samples.front().t; }

    /**
     * @brief Last timestamp (recording must be non-empty)
     */
    double end_time() const { return samples.back().t; }

    bool is_sorted() const {
        return std::is_sorted(samples.begin(), samples.end(),
                              [](const Sample& a, const Sample& b) { return a.t < b.t; });
    }

    bool has_column(Field f) const {
        return std::any_of(columns.begin(), columns.end(),
                           [f](const auto& c) { return c.first == f; });
    }

    RecordingStats stats() const {
        RecordingStats s;
        s.sample_count = samples.size();
        if (samples.empty()) return s;
        s.first_t = start_time();
        s.last_t = end_time();
        s.duration = s.last_t - s.first_t;
        if (s.duration > 0.0) {
            s.mean_rate = static_cast<double>(s.sample_count - 1) / s.duration;
        }
        return s;
    }
};

/**
 * @brief Planar position derived for one magnetic sample
 */
struct PositionEstimate {
    std::size_t sample_index{0};  ///< Index of the source sample in the magnetic recording
    double t{0.0};                ///< Timestamp of the source sample
    double x{0.0};
    double y{0.0};
};
