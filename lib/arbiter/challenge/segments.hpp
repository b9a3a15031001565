#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <vector>
#include "types.hpp"

namespace arbiter::challenge {
    struct segment_t {
        uint64_t start = 0;
        uint64_t length = 0;

        bool operator==(const segment_t &o) const = default;
    };

    /*
     * A round over [start, start + length) with degree D commits to D + 1 boundary hashes.
     * Sub-segment i starts at start + (length / D) * i and is length / D units long,
     * except the last one which also absorbs the remainder length % D.
     */
    [[nodiscard]] extern segment_t sub_segment(uint64_t start, uint64_t length, uint64_t degree, uint64_t position);
    [[nodiscard]] extern std::vector<segment_t> split_segments(uint64_t start, uint64_t length, uint64_t degree);

    // Throws err_degenerate_selection_t unless the selection has at least two segments
    // and the position refers to one of the sub-segments between them
    extern void validate_selection(const segment_selection_t &selection);
    [[nodiscard]] extern segment_t extract_segment(const segment_selection_t &selection);

    [[nodiscard]] extern hash_t hash_state(uint64_t segments_start, uint64_t segments_length, const segments_t &segments);

    [[nodiscard]] inline hash_t hash_state(const segment_selection_t &selection)
    {
        return hash_state(selection.old_segments_start, selection.old_segments_length, selection.old_segments);
    }

    // The mover must agree with the committed start of the contested sub-segment and disagree with its end
    extern void validate_bisection(const segment_selection_t &selection, const hash_t &start_hash, const hash_t &end_hash);

    template<typename CFG>
    constexpr uint64_t expected_degree(const uint64_t segment_length)
    {
        return std::min(segment_length, CFG::max_challenge_degree);
    }
}

namespace fmt {
    template<>
    struct formatter<arbiter::challenge::segment_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const arbiter::challenge::segment_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[{}, {})", v.start, v.start + v.length);
        }
    };
}
