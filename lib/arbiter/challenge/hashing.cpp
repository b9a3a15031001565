/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "hashing.hpp"

namespace arbiter::challenge {
    using namespace std::string_view_literals;

    void value_t::to_packed(codec::packed::encoder &enc) const
    {
        enc.process(type);
        enc.process(contents);
    }

    hash_t value_t::hash() const
    {
        return codec::packed::digest(config_base::label_value, *this);
    }

    hash_t value_stack_t::hash() const
    {
        auto h = remaining_hash;
        for (const auto &v: proved)
            h = codec::packed::digest(config_base::label_value_stack, v.hash(), h);
        return h;
    }

    hash_t stack_frame_t::hash() const
    {
        return codec::packed::digest("Stack frame:"sv, return_pc.hash(), locals_merkle_root, caller_module, caller_module_internals);
    }

    hash_t stack_frame_window_t::hash() const
    {
        auto h = remaining_hash;
        for (const auto &f: proved)
            h = codec::packed::digest("Stack frame stack:"sv, f.hash(), h);
        return h;
    }

    machine_t machine_t::start(const hash_t &global_state_hash, const hash_t &wasm_module_root)
    {
        machine_t mach {};
        mach.status = machine_status_t::running;
        // the function call ABI of the entry point
        mach.value_stack.proved = { value_t::new_ref_null(), value_t::new_i32(0), value_t::new_i32(0) };
        mach.global_state_hash = global_state_hash;
        mach.modules_root = wasm_module_root;
        return mach;
    }

    hash_t machine_t::hash() const
    {
        switch (status) {
            case machine_status_t::running:
                return codec::packed::digest(
                    config_base::label_machine_running,
                    value_stack.hash(),
                    internal_stack.hash(),
                    frame_stack.hash(),
                    global_state_hash,
                    module_idx,
                    function_idx,
                    function_pc,
                    modules_root
                );
            case machine_status_t::finished:
            case machine_status_t::errored:
            case machine_status_t::too_far:
                return hash_end_machine(status, global_state_hash);
            default:
                throw err_invalid_status_t {};
        }
    }

    hash_t hash_start_machine(const hash_t &global_state_hash, const hash_t &wasm_module_root)
    {
        return machine_t::start(global_state_hash, wasm_module_root).hash();
    }

    hash_t hash_end_machine(const machine_status_t status, const hash_t &global_state_hash)
    {
        switch (status) {
            case machine_status_t::finished:
                return codec::packed::digest(config_base::label_machine_finished, global_state_hash);
            case machine_status_t::errored:
                return codec::packed::digest(config_base::label_machine_errored);
            case machine_status_t::too_far:
                return codec::packed::digest(config_base::label_machine_too_far);
            default:
                throw err_invalid_status_t {};
        }
    }

    hash_t hash_block_state(const machine_status_t status, const hash_t &global_state_hash)
    {
        switch (status) {
            case machine_status_t::finished:
                return codec::packed::digest(config_base::label_block_state, global_state_hash);
            case machine_status_t::errored:
                return codec::packed::digest(config_base::label_block_state_errored, global_state_hash);
            case machine_status_t::too_far:
                return codec::packed::digest(config_base::label_block_state_too_far);
            default:
                throw err_invalid_status_t {};
        }
    }
}
