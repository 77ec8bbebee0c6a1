#pragma once
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include "alignment.hpp"
#include "mapping_strategy.hpp"
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief What to do with a magnetic sample that cannot be aligned
 */
enum class UnalignedPolicy {
    FAIL = 0,  ///< Throw AlignmentError
    SKIP       ///< Leave the sample out and record its index
};

struct PositionCalculatorOptions {
    double tolerance{1.0};                       ///< Alignment window in recording time units
    UnalignedPolicy unaligned{UnalignedPolicy::FAIL};
};

/**
 * @brief Output of compute_positions()
 *
 * Estimates are in magnetic sample order. With UnalignedPolicy::FAIL the
 * i-th estimate belongs to the i-th sample; with SKIP the indices of the
 * left-out samples are listed in `skipped`.
 */
struct PositionResult {
    std::vector<PositionEstimate> estimates;
    std::vector<std::size_t> skipped;
};

/**
 * @brief Derive a planar position for every magnetic sample
 *
 * Aligns each sample against the reference recording as the strategy
 * requires, maps it, and collects the results in input order.
 *
 * @param magnetic Magnetic recording (non-empty, sorted)
 * @param reference Ground-truth recording, or nullptr for calibration models
 * @param strategy Mapping from aligned sample to planar coordinates
 * @param options Tolerance and unaligned-sample policy
 * @throws EmptyRecordingError if the magnetic recording is empty
 * @throws AlignmentError if the strategy needs a reference and none (or an
 *         empty or non-positional one) is given, if the reference range does not overlap the
 *         magnetic range, or if a sample cannot be aligned under FAIL
 * @throws MalformedRecordingError if a reference sample lacks a position
 */
inline PositionResult compute_positions(const Recording& magnetic, const Recording* reference,
                                        const IMappingStrategy& strategy,
                                        const PositionCalculatorOptions& options = {}) {
    if (magnetic.empty()) {
        throw EmptyRecordingError(magnetic.name);
    }

    const auto mode = strategy.alignment_mode();
    if (reference != nullptr && reference->empty()) {
        throw AlignmentError(reference->name, 0, "reference recording is empty");
    }
    if (strategy.requires_reference() && reference == nullptr) {
        throw AlignmentError(magnetic.name, 0,
                             "strategy '" + strategy.name() + "' needs a reference recording");
    }
    if (strategy.requires_reference()) {
        if (reference->kind != RecordingKind::POSITIONAL) {
            throw AlignmentError(reference->name, 0,
                                 "strategy '" + strategy.name() + "' needs a positional reference, got a " +
                                 recording_kind_to_string(reference->kind) + " recording");
        }
        for (std::size_t i = 0; i < reference->size(); ++i) {
            if (!(*reference)[i].position) {
                throw MalformedRecordingError(reference->name, "reference sample " +
                                              std::to_string(i) + " has no position");
            }
        }
    }

    PositionResult result;
    result.estimates.reserve(magnetic.size());

    if (reference == nullptr) {
        const AlignedReference none;
        for (std::size_t i = 0; i < magnetic.size(); ++i) {
            const Sample& s = magnetic[i];
            PlanarPoint p = strategy.map(s, none);
            result.estimates.push_back(PositionEstimate{i, s.t, p.x, p.y});
        }
        return result;
    }

    TimestampAligner aligner(*reference, options.tolerance);
    if (!aligner.overlaps(magnetic.start_time(), magnetic.end_time())) {
        throw AlignmentError(reference->name, 0,
                             "reference time range does not overlap '" + magnetic.name + "'");
    }

    for (std::size_t i = 0; i < magnetic.size(); ++i) {
        const Sample& s = magnetic[i];
        AlignedReference ref;
        bool aligned = true;
        switch (mode) {
            case IMappingStrategy::AlignmentMode::NEAREST:
                aligned = aligner.align_nearest(s.t, ref);
                break;
            case IMappingStrategy::AlignmentMode::BRACKET:
                aligned = aligner.align_bracket(s.t, ref);
                break;
            case IMappingStrategy::AlignmentMode::NONE:
                break;
        }

        if (!aligned) {
            if (options.unaligned == UnalignedPolicy::SKIP) {
                result.skipped.push_back(i);
                continue;
            }
            throw AlignmentError(magnetic.name + "[" + std::to_string(i) + "]", i,
                                 "no reference sample within " + std::to_string(options.tolerance) +
                                 " of " + s.to_string());
        }

        PlanarPoint p = strategy.map(s, ref);
        result.estimates.push_back(PositionEstimate{i, s.t, p.x, p.y});
    }
    return result;
}
