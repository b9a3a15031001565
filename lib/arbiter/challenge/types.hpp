#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>
#include <arbiter/codec/packed.hpp>
#include <arbiter/codec/serializable.hpp>
#include <arbiter/common/bytes.hpp>
#include <arbiter/crypto/keccak.hpp>

namespace arbiter::challenge {
    using hash_t = crypto::keccak::hash_t;
    using address_t = byte_array<20>;
    using timestamp_t = uint64_t;
    using seconds_t = uint64_t;
    using challenge_index_t = uint64_t;
    using segments_t = std::vector<hash_t>;

    // Index 0 is never allocated to a challenge
    static constexpr challenge_index_t no_challenge_index = 0;

    // Constants that are the same in all configurations
    struct config_base {
        static constexpr std::string_view label_global_state { "Global state:" };
        static constexpr std::string_view label_value { "Value:" };
        static constexpr std::string_view label_value_stack { "Value stack:" };
        static constexpr std::string_view label_machine_running { "Machine running:" };
        static constexpr std::string_view label_machine_finished { "Machine finished:" };
        static constexpr std::string_view label_machine_errored { "Machine errored:" };
        static constexpr std::string_view label_machine_too_far { "Machine too far:" };
        static constexpr std::string_view label_block_state { "Block state:" };
        static constexpr std::string_view label_block_state_errored { "Block state, errored:" };
        static constexpr std::string_view label_block_state_too_far { "Block state, too far:" };
    };

    struct config_prod: config_base {
        // bounds the number of segments a single bisection may submit
        static constexpr uint64_t max_challenge_degree = 40;
        // bounds the number of machine steps an execution challenge may span
        static constexpr uint64_t max_steps = uint64_t { 1 } << 43U;
    };

    struct config_tiny: config_prod {
        static constexpr uint64_t max_challenge_degree = 4;
        static constexpr uint64_t max_steps = uint64_t { 1 } << 10U;
    };

    enum class machine_status_t: uint8_t {
        running = 0,
        finished = 1,
        errored = 2,
        blocked = 3,
        too_far = 4
    };

    enum class challenge_mode_t: uint8_t {
        none = 0,
        block = 1,
        execution = 2
    };

    enum class termination_type_t: uint8_t {
        timeout = 0,
        block_proof = 1,
        execution_proof = 2,
        cleared = 3
    };

    using machine_statuses_t = std::array<machine_status_t, 2>;
    using state_hashes_t = std::array<hash_t, 2>;

    struct global_state_t {
        hash_t block_hash {};
        hash_t send_root {};
        uint64_t inbox_position = 0;
        uint64_t position_in_message = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("block_hash"sv, block_hash);
            archive.process("send_root"sv, send_root);
            archive.process("inbox_position"sv, inbox_position);
            archive.process("position_in_message"sv, position_in_message);
        }

        void to_packed(codec::packed::encoder &enc) const
        {
            enc.process(config_base::label_global_state);
            enc.process(block_hash);
            enc.process(send_root);
            enc.process(inbox_position);
            enc.process(position_in_message);
        }

        [[nodiscard]] hash_t hash() const
        {
            return codec::packed::digest(*this);
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return block_hash.is_zero() && send_root.is_zero() && inbox_position == 0 && position_in_message == 0;
        }

        bool operator==(const global_state_t &o) const = default;
    };
    using global_states_t = std::array<global_state_t, 2>;

    struct participant_t {
        address_t addr {};
        seconds_t time_left = 0;

        bool operator==(const participant_t &o) const = default;
    };

    struct challenge_t {
        participant_t current {};
        participant_t next {};
        timestamp_t last_move_timestamp = 0;
        hash_t wasm_module_root {};
        hash_t challenge_state_hash {};
        uint64_t max_inbox_messages = 0;
        challenge_mode_t mode = challenge_mode_t::none;

        [[nodiscard]] bool exists() const noexcept
        {
            return mode != challenge_mode_t::none;
        }

        [[nodiscard]] seconds_t time_used_since_last_move(const timestamp_t now) const
        {
            return now > last_move_timestamp ? now - last_move_timestamp : 0;
        }

        [[nodiscard]] bool is_timed_out(const timestamp_t now) const
        {
            return time_used_since_last_move(now) > current.time_left;
        }

        bool operator==(const challenge_t &o) const = default;
    };

    struct segment_selection_t {
        uint64_t old_segments_start = 0;
        uint64_t old_segments_length = 0;
        segments_t old_segments {};
        uint64_t challenge_position = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("old_segments_start"sv, old_segments_start);
            archive.process("old_segments_length"sv, old_segments_length);
            archive.process("old_segments"sv, old_segments);
            archive.process("challenge_position"sv, challenge_position);
        }
    };

    // The parameters a result receiver supplies to open a challenge
    struct challenge_params_t {
        hash_t wasm_module_root {};
        machine_statuses_t statuses { machine_status_t::finished, machine_status_t::finished };
        global_states_t global_states {};
        uint64_t num_blocks = 0;
        address_t asserter {};
        address_t challenger {};
        seconds_t asserter_time_left = 0;
        seconds_t challenger_time_left = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("wasm_module_root"sv, wasm_module_root);
            archive.process("statuses"sv, statuses);
            archive.process("global_states"sv, global_states);
            archive.process("num_blocks"sv, num_blocks);
            archive.process("asserter"sv, asserter);
            archive.process("challenger"sv, challenger);
            archive.process("asserter_time_left"sv, asserter_time_left);
            archive.process("challenger_time_left"sv, challenger_time_left);
        }
    };
}

namespace arbiter::codec {
    template<>
    struct enum_names<challenge::machine_status_t> {
        static constexpr std::array<std::string_view, 5> names { "running", "finished", "errored", "blocked", "too_far" };
    };

    template<>
    struct enum_names<challenge::challenge_mode_t> {
        static constexpr std::array<std::string_view, 3> names { "none", "block", "execution" };
    };

    template<>
    struct enum_names<challenge::termination_type_t> {
        static constexpr std::array<std::string_view, 4> names { "timeout", "block_proof", "execution_proof", "cleared" };
    };
}
