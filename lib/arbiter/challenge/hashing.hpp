#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include "types.hpp"

/*
 * Commitments to machine, block and global states. Each commitment kind uses its own label
 * so that commitments of different kinds never share a preimage. The layouts must match
 * the ones used by the one-step prover, otherwise a freshly started machine would hash
 * differently on the two sides.
 */
namespace arbiter::challenge {
    enum class value_type_t: uint8_t {
        i32 = 0,
        i64 = 1,
        f32 = 2,
        f64 = 3,
        ref_null = 4,
        func_ref = 5,
        internal_ref = 6,
        stack_boundary = 7
    };

    struct value_t {
        value_type_t type = value_type_t::i32;
        codec::packed::uint256_t contents {};

        static value_t new_ref_null()
        {
            return { value_type_t::ref_null, {} };
        }

        static value_t new_i32(const uint32_t x)
        {
            return { value_type_t::i32, { x } };
        }

        void to_packed(codec::packed::encoder &enc) const;
        [[nodiscard]] hash_t hash() const;
    };

    struct value_stack_t {
        std::vector<value_t> proved {};
        hash_t remaining_hash {};

        [[nodiscard]] hash_t hash() const;
    };

    struct stack_frame_t {
        value_t return_pc {};
        hash_t locals_merkle_root {};
        uint32_t caller_module = 0;
        uint32_t caller_module_internals = 0;

        [[nodiscard]] hash_t hash() const;
    };

    struct stack_frame_window_t {
        std::vector<stack_frame_t> proved {};
        hash_t remaining_hash {};

        [[nodiscard]] hash_t hash() const;
    };

    struct machine_t {
        machine_status_t status = machine_status_t::running;
        value_stack_t value_stack {};
        value_stack_t internal_stack {};
        stack_frame_window_t frame_stack {};
        hash_t global_state_hash {};
        uint32_t module_idx = 0;
        uint32_t function_idx = 0;
        uint32_t function_pc = 0;
        hash_t modules_root {};

        // A running machine about to call the entry point of the main module
        static machine_t start(const hash_t &global_state_hash, const hash_t &wasm_module_root);

        // Throws err_invalid_status_t for blocked machines
        [[nodiscard]] hash_t hash() const;
    };

    [[nodiscard]] extern hash_t hash_start_machine(const hash_t &global_state_hash, const hash_t &wasm_module_root);
    [[nodiscard]] extern hash_t hash_end_machine(machine_status_t status, const hash_t &global_state_hash);
    [[nodiscard]] extern hash_t hash_block_state(machine_status_t status, const hash_t &global_state_hash);
}

namespace arbiter::codec {
    template<>
    struct enum_names<challenge::value_type_t> {
        static constexpr std::array<std::string_view, 8> names {
            "i32", "i64", "f32", "f64", "ref_null", "func_ref", "internal_ref", "stack_boundary"
        };
    };
}
