#pragma once
#include "../core/sample.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

/**
 * @brief Reference samples a magnetic sample was aligned to
 *
 * Pointers refer into the reference recording and are null when the
 * corresponding lookup was not performed.
 */
struct AlignedReference {
    const Sample* nearest{nullptr};  ///< Reference sample closest in time
    const Sample* lower{nullptr};    ///< Start of the enclosing segment
    const Sample* upper{nullptr};    ///< End of the enclosing segment
    double offset{0.0};              ///< Sample time minus matched reference time
};

/**
 * @brief Timestamp lookups in a sorted reference recording
 *
 * Nearest match picks the reference sample with the smallest |dt|, the
 * earlier one on a tie. Bracketing returns the consecutive pair enclosing a
 * timestamp, or the first pair before the start so callers can extrapolate
 * backwards. Timestamps after the last reference sample do not bracket.
 */
class TimestampAligner {
private:
    const Recording& reference_;
    double tolerance_;

    std::size_t first_after(double t) const {
        auto it = std::upper_bound(reference_.samples.begin(), reference_.samples.end(), t,
                                   [](double v, const Sample& s) { return v < s.t; });
        return static_cast<std::size_t>(it - reference_.samples.begin());
    }

public:
    /**
     * @param reference Non-empty recording sorted by timestamp
     * @param tolerance Maximum accepted time distance (>= 0)
     */
    TimestampAligner(const Recording& reference, double tolerance)
        : reference_(reference), tolerance_(tolerance) {}

    double tolerance() const { return tolerance_; }

    /**
     * @brief Index of the reference sample closest in time to t
     */
    std::size_t nearest_index(double t) const {
        const auto& samples = reference_.samples;
        auto it = std::lower_bound(samples.begin(), samples.end(), t,
                                   [](const Sample& s, double v) { return s.t < v; });
        if (it == samples.begin()) return 0;
        if (it == samples.end()) return samples.size() - 1;
        auto prev = it - 1;
        // earlier sample wins a tie
        if (t - prev->t <= it->t - t) {
            return static_cast<std::size_t>(prev - samples.begin());
        }
        return static_cast<std::size_t>(it - samples.begin());
    }

    /**
     * @brief Nearest reference sample if within tolerance
     * @return true if aligned
     */
    bool align_nearest(double t, AlignedReference& out) const {
        const Sample& s = reference_.samples[nearest_index(t)];
        out.nearest = &s;
        out.offset = t - s.t;
        return std::abs(out.offset) <= tolerance_;
    }

    /**
     * @brief Enclosing reference segment
     *
     * Any t up to the last reference timestamp aligns; earlier than the
     * first one the first segment is returned. The tolerance does not widen
     * either end.
     *
     * @return true if t <= last reference timestamp
     */
    bool align_bracket(double t, AlignedReference& out) const {
        const auto& samples = reference_.samples;
        const std::size_t n = samples.size();
        std::size_t upper = first_after(t);
        std::size_t lower;
        if (n == 1) {
            lower = upper = 0;
        } else if (upper == 0) {
            lower = 0;
            upper = 1;
        } else if (upper >= n) {
            lower = n - 2;
            upper = n - 1;
        } else {
            lower = upper - 1;
        }
        out.lower = &samples[lower];
        out.upper = &samples[upper];
        out.nearest = &samples[nearest_index(t)];
        out.offset = t - out.lower->t;
        return t <= reference_.end_time();
    }

    /**
     * @brief Whether the reference range, widened by tolerance, overlaps [start, end]
     */
    bool overlaps(double start, double end) const {
        return start <= reference_.end_time() + tolerance_ &&
               end >= reference_.start_time() - tolerance_;
    }
};
