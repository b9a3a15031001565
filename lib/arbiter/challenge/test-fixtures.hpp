#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <vector>
#include <arbiter/common/test.hpp>
#include "hashing.hpp"
#include "interfaces.hpp"
#include "segments.hpp"

namespace arbiter::challenge {
    inline hash_t filled_hash(const uint8_t b)
    {
        hash_t h {};
        h.fill(b);
        return h;
    }

    inline address_t filled_address(const uint8_t b)
    {
        address_t a {};
        a.fill(b);
        return a;
    }

    inline const address_t test_asserter = filled_address(0xAA);
    inline const address_t test_challenger = filled_address(0xCC);
    inline const address_t test_receiver = filled_address(0x55);
    inline const address_t test_outsider = filled_address(0x99);
    inline const hash_t test_module_root = filled_hash(0xAB);

    inline challenge_params_t test_params(const uint64_t num_blocks=8, const seconds_t asserter_time=1000, const seconds_t challenger_time=1000)
    {
        challenge_params_t p {};
        p.wasm_module_root = test_module_root;
        p.global_states[0] = global_state_t { filled_hash(0x01), filled_hash(0x02), 3, 0 };
        p.global_states[1] = global_state_t { filled_hash(0x11), filled_hash(0x12), 5, 0 };
        p.num_blocks = num_blocks;
        p.asserter = test_asserter;
        p.challenger = test_challenger;
        p.asserter_time_left = asserter_time;
        p.challenger_time_left = challenger_time;
        return p;
    }

    inline segments_t initial_segments(const challenge_params_t &p)
    {
        return {
            hash_block_state(p.statuses[0], p.global_states[0].hash()),
            hash_block_state(p.statuses[1], p.global_states[1].hash())
        };
    }

    // Global state hash of the i-th block boundary as claimed by the bisecting party
    inline hash_t claimed_global_state(const uint64_t i)
    {
        return filled_hash(static_cast<uint8_t>(0x20 + i));
    }

    inline hash_t disagreeing_hash(const hash_t &h)
    {
        auto res = h;
        res[0] ^= 0xFF;
        return res;
    }

    // Agrees with the start of the contested segment and disagrees with its end
    inline segments_t block_bisection(const segments_t &old, const uint64_t position, const uint64_t degree)
    {
        segments_t res {};
        res.emplace_back(old.at(position));
        for (uint64_t i = 1; i < degree; ++i)
            res.emplace_back(hash_block_state(machine_status_t::finished, claimed_global_state(i)));
        res.emplace_back(disagreeing_hash(old.at(position + 1)));
        return res;
    }

    inline segments_t step_bisection(const segments_t &old, const uint64_t position, const uint64_t degree)
    {
        segments_t res {};
        res.emplace_back(old.at(position));
        for (uint64_t i = 1; i < degree; ++i)
            res.emplace_back(filled_hash(static_cast<uint8_t>(0x40 + i)));
        res.emplace_back(disagreeing_hash(old.at(position + 1)));
        return res;
    }

    struct manual_clock_t: time_source_t {
        timestamp_t value = 1000;

        [[nodiscard]] timestamp_t now() const override
        {
            return value;
        }
    };

    struct mock_prover_t: one_step_prover_t {
        hash_t result = filled_hash(0xF0);
        bool fail = false;
        size_t num_calls = 0;
        execution_context_t last_ctx {};
        uint64_t last_step = 0;
        hash_t last_before {};

        [[nodiscard]] hash_t prove_one_step(const execution_context_t &ctx, const uint64_t step, const hash_t &before_hash, buffer) override
        {
            ++num_calls;
            last_ctx = ctx;
            last_step = step;
            last_before = before_hash;
            if (fail)
                throw error("invalid one-step proof");
            return result;
        }
    };

    struct completion_t {
        challenge_index_t index = 0;
        address_t winner {};
        address_t loser {};

        bool operator==(const completion_t &o) const = default;
    };

    struct mock_receiver_t: result_receiver_t {
        address_t addr = test_receiver;
        std::vector<completion_t> completed {};
        bool fail = false;

        [[nodiscard]] const address_t &address() const override
        {
            return addr;
        }

        void complete_challenge(const challenge_index_t index, const address_t &winner, const address_t &loser) override
        {
            if (fail)
                throw error("result receiver is unavailable");
            completed.emplace_back(completion_t { index, winner, loser });
        }
    };

    struct recording_sink_t: event_sink_t {
        std::vector<std::string> events {};

        void initiated(const challenge_index_t index, const global_state_t &, const global_state_t &) override
        {
            events.emplace_back(fmt::format("initiated {}", index));
        }

        void bisected(const challenge_index_t index, const hash_t &, const uint64_t start, const uint64_t length, const segments_t &segments) override
        {
            events.emplace_back(fmt::format("bisected {} {} {} {}", index, start, length, segments.size()));
        }

        void execution_begun(const challenge_index_t index, const uint64_t block_position) override
        {
            events.emplace_back(fmt::format("execution_begun {} {}", index, block_position));
        }

        void one_step_proof_completed(const challenge_index_t index) override
        {
            events.emplace_back(fmt::format("one_step_proof_completed {}", index));
        }

        void ended(const challenge_index_t index, const termination_type_t kind) override
        {
            events.emplace_back(fmt::format("ended {} {}", index, kind));
        }
    };
}
