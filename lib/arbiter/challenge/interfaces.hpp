#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <memory>
#include "types.hpp"

/*
 * Collaborators of the challenge manager. Their internals are outside of this library.
 */
namespace arbiter::challenge {
    struct bridge_t {
        virtual ~bridge_t() = default;
    };
    using bridge_ptr_t = std::shared_ptr<bridge_t>;

    struct sequencer_inbox_t {
        virtual ~sequencer_inbox_t() = default;
    };
    using sequencer_inbox_ptr_t = std::shared_ptr<sequencer_inbox_t>;

    struct execution_context_t {
        uint64_t max_inbox_messages = 0;
        const bridge_t *bridge = nullptr;
    };

    struct one_step_prover_t {
        virtual ~one_step_prover_t() = default;
        // Returns the hash of the machine after executing one step from the state with before_hash
        [[nodiscard]] virtual hash_t prove_one_step(const execution_context_t &ctx, uint64_t step, const hash_t &before_hash, buffer proof) = 0;
    };
    using one_step_prover_ptr_t = std::shared_ptr<one_step_prover_t>;

    struct result_receiver_t {
        virtual ~result_receiver_t() = default;
        [[nodiscard]] virtual const address_t &address() const = 0;
        virtual void complete_challenge(challenge_index_t index, const address_t &winner, const address_t &loser) = 0;
    };
    using result_receiver_ptr_t = std::shared_ptr<result_receiver_t>;

    struct time_source_t {
        virtual ~time_source_t() = default;
        [[nodiscard]] virtual timestamp_t now() const = 0;
    };
    using time_source_ptr_t = std::shared_ptr<time_source_t>;

    struct system_time_source_t: time_source_t {
        [[nodiscard]] timestamp_t now() const override
        {
            const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
            return static_cast<timestamp_t>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
        }
    };

    struct event_sink_t {
        virtual ~event_sink_t() = default;
        virtual void initiated(challenge_index_t index, const global_state_t &start_state, const global_state_t &end_state) = 0;
        virtual void bisected(challenge_index_t index, const hash_t &state_hash, uint64_t start, uint64_t length, const segments_t &segments) = 0;
        virtual void execution_begun(challenge_index_t index, uint64_t block_position) = 0;
        virtual void one_step_proof_completed(challenge_index_t index) = 0;
        virtual void ended(challenge_index_t index, termination_type_t kind) = 0;
    };
    using event_sink_ptr_t = std::shared_ptr<event_sink_t>;
}
