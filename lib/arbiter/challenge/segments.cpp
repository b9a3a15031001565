/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "segments.hpp"

namespace arbiter::challenge {
    segment_t sub_segment(const uint64_t start, const uint64_t length, const uint64_t degree, const uint64_t position)
    {
        if (degree == 0 || position >= degree) [[unlikely]]
            throw err_degenerate_selection_t {};
        segment_t res { 0, length / degree };
        // the start is computed before the remainder is added to the last segment
        res.start = start + res.length * position;
        if (position == degree - 1)
            res.length += length % degree;
        return res;
    }

    std::vector<segment_t> split_segments(const uint64_t start, const uint64_t length, const uint64_t degree)
    {
        std::vector<segment_t> res {};
        res.reserve(degree);
        for (uint64_t pos = 0; pos < degree; ++pos)
            res.emplace_back(sub_segment(start, length, degree, pos));
        return res;
    }

    void validate_selection(const segment_selection_t &selection)
    {
        if (selection.old_segments.size() < 2 || selection.challenge_position >= selection.old_segments.size() - 1) [[unlikely]]
            throw err_degenerate_selection_t {};
    }

    segment_t extract_segment(const segment_selection_t &selection)
    {
        validate_selection(selection);
        return sub_segment(selection.old_segments_start, selection.old_segments_length,
            selection.old_segments.size() - 1, selection.challenge_position);
    }

    hash_t hash_state(const uint64_t segments_start, const uint64_t segments_length, const segments_t &segments)
    {
        return codec::packed::digest(
            codec::packed::uint256_t { segments_start },
            codec::packed::uint256_t { segments_length },
            segments
        );
    }

    void validate_bisection(const segment_selection_t &selection, const hash_t &start_hash, const hash_t &end_hash)
    {
        validate_selection(selection);
        const auto pos = selection.challenge_position;
        if (selection.old_segments[pos] != start_hash) [[unlikely]]
            throw err_wrong_start_t {};
        if (selection.old_segments[pos + 1] == end_hash) [[unlikely]]
            throw err_same_end_t {};
    }
}
