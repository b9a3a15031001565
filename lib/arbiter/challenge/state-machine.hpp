#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include "interfaces.hpp"
#include "segments.hpp"

namespace arbiter::challenge {
    enum class mode_requirement_t: uint8_t {
        any,
        block,
        execution
    };

    // A bisection round committed into challenge_state_hash
    struct round_t {
        uint64_t start = 0;
        uint64_t length = 0;
        segments_t segments {};
        hash_t state_hash {};

        bool operator==(const round_t &o) const = default;
    };

    struct created_challenge_t {
        challenge_t challenge {};
        round_t round {};
    };

    struct outcome_t {
        address_t winner {};
        address_t loser {};

        bool operator==(const outcome_t &o) const = default;
    };

    /*
     * Transitions of a single challenge record. Every operation performs all of its checks
     * before it modifies the record, so a call that throws leaves the record unchanged.
     */
    template<typename CFG=config_prod>
    struct state_machine_t {
        [[nodiscard]] static created_challenge_t create(const challenge_params_t &params, timestamp_t now);

        [[nodiscard]] static round_t bisect(challenge_t &c, const address_t &caller, timestamp_t now,
            const segment_selection_t &selection, const segments_t &new_segments);

        // Returns std::nullopt when the block is resolved without an execution challenge
        [[nodiscard]] static std::optional<round_t> challenge_execution(challenge_t &c, const address_t &caller, timestamp_t now,
            const segment_selection_t &selection, const machine_statuses_t &statuses, const state_hashes_t &global_state_hashes,
            uint64_t num_steps);

        static void one_step_prove(challenge_t &c, const address_t &caller, timestamp_t now,
            const segment_selection_t &selection, buffer proof, one_step_prover_t &prover, const execution_context_t &ctx);

        // The caller is responsible for deleting the record once the outcome is accepted
        [[nodiscard]] static outcome_t timeout(const challenge_t &c, timestamp_t now);
        static void clear(const challenge_t &c);

        static void take_turn(const challenge_t &c, const address_t &caller, timestamp_t now,
            mode_requirement_t req, const segment_selection_t &selection);
        static void complete_turn(challenge_t &c, timestamp_t now);
    private:
        static round_t _commit(challenge_t &c, uint64_t start, uint64_t length, segments_t segments);
        static void _current_win(challenge_t &c, timestamp_t now);
    };
}
