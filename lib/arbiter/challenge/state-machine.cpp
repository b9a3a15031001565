/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "hashing.hpp"
#include "state-machine.hpp"

namespace arbiter::challenge {
    template<typename CFG>
    created_challenge_t state_machine_t<CFG>::create(const challenge_params_t &params, const timestamp_t now)
    {
        if (params.num_blocks == 0) [[unlikely]]
            throw err_challenge_too_short_t {};
        segments_t segments {
            hash_block_state(params.statuses[0], params.global_states[0].hash()),
            hash_block_state(params.statuses[1], params.global_states[1].hash())
        };
        const auto &end_state = params.global_states[1];
        created_challenge_t res {};
        auto &c = res.challenge;
        c.wasm_module_root = params.wasm_module_root;
        // a partially read or an errored message still counts as read
        c.max_inbox_messages = end_state.inbox_position;
        if (params.statuses[1] == machine_status_t::errored || end_state.position_in_message > 0)
            ++c.max_inbox_messages;
        c.next = participant_t { params.asserter, params.asserter_time_left };
        c.current = participant_t { params.challenger, params.challenger_time_left };
        c.last_move_timestamp = now;
        c.mode = challenge_mode_t::block;
        res.round = _commit(c, 0, params.num_blocks, std::move(segments));
        return res;
    }

    template<typename CFG>
    round_t state_machine_t<CFG>::bisect(challenge_t &c, const address_t &caller, const timestamp_t now,
        const segment_selection_t &selection, const segments_t &new_segments)
    {
        take_turn(c, caller, now, mode_requirement_t::any, selection);
        const auto [start, length] = extract_segment(selection);
        if (length <= 1) [[unlikely]]
            throw err_too_short_t {};
        if (new_segments.size() != expected_degree<CFG>(length) + 1) [[unlikely]]
            throw err_wrong_degree_t {};
        validate_bisection(selection, new_segments.front(), new_segments.back());
        auto round = _commit(c, start, length, new_segments);
        complete_turn(c, now);
        return round;
    }

    template<typename CFG>
    std::optional<round_t> state_machine_t<CFG>::challenge_execution(challenge_t &c, const address_t &caller, const timestamp_t now,
        const segment_selection_t &selection, const machine_statuses_t &statuses, const state_hashes_t &global_state_hashes,
        const uint64_t num_steps)
    {
        take_turn(c, caller, now, mode_requirement_t::block, selection);
        if (num_steps < 1) [[unlikely]]
            throw err_challenge_too_short_t {};
        if (num_steps > CFG::max_steps) [[unlikely]]
            throw err_challenge_too_long_t {};
        validate_bisection(selection,
            hash_block_state(statuses[0], global_state_hashes[0]),
            hash_block_state(statuses[1], global_state_hashes[1]));
        const auto [start, length] = extract_segment(selection);
        if (length != 1) [[unlikely]]
            throw err_too_long_t {};

        if (statuses[0] != machine_status_t::finished) {
            // a machine that halted before the block cannot make progress within it
            if (statuses[0] != statuses[1] || global_state_hashes[0] != global_state_hashes[1]) [[unlikely]]
                throw err_halted_change_t {};
            _current_win(c, now);
            return {};
        }
        // an errored block must leave the global state unchanged
        if (statuses[1] == machine_status_t::errored && global_state_hashes[0] != global_state_hashes[1]) [[unlikely]]
            throw err_error_change_t {};

        segments_t segments {
            hash_start_machine(global_state_hashes[0], c.wasm_module_root),
            hash_end_machine(statuses[1], global_state_hashes[1])
        };
        auto round = _commit(c, 0, num_steps, std::move(segments));
        c.mode = challenge_mode_t::execution;
        complete_turn(c, now);
        return round;
    }

    template<typename CFG>
    void state_machine_t<CFG>::one_step_prove(challenge_t &c, const address_t &caller, const timestamp_t now,
        const segment_selection_t &selection, const buffer proof, one_step_prover_t &prover, const execution_context_t &ctx)
    {
        take_turn(c, caller, now, mode_requirement_t::execution, selection);
        const auto [start, length] = extract_segment(selection);
        if (length != 1) [[unlikely]]
            throw err_too_long_t {};
        const auto pos = selection.challenge_position;
        const auto after_hash = prover.prove_one_step(ctx, start, selection.old_segments[pos], proof);
        if (after_hash == selection.old_segments[pos + 1]) [[unlikely]]
            throw err_same_proof_end_t {};
        _current_win(c, now);
    }

    template<typename CFG>
    outcome_t state_machine_t<CFG>::timeout(const challenge_t &c, const timestamp_t now)
    {
        if (!c.exists()) [[unlikely]]
            throw err_no_challenge_t {};
        if (!c.is_timed_out(now)) [[unlikely]]
            throw err_not_timed_out_t {};
        return { c.next.addr, c.current.addr };
    }

    template<typename CFG>
    void state_machine_t<CFG>::clear(const challenge_t &c)
    {
        if (!c.exists()) [[unlikely]]
            throw err_no_challenge_t {};
    }

    template<typename CFG>
    void state_machine_t<CFG>::take_turn(const challenge_t &c, const address_t &caller, const timestamp_t now,
        const mode_requirement_t req, const segment_selection_t &selection)
    {
        if (!c.exists()) [[unlikely]]
            throw err_no_challenge_t {};
        if (caller != c.current.addr) [[unlikely]]
            throw err_not_current_responder_t {};
        if (c.is_timed_out(now)) [[unlikely]]
            throw err_deadline_passed_t {};
        switch (req) {
            case mode_requirement_t::any:
                break;
            case mode_requirement_t::block:
                if (c.mode != challenge_mode_t::block) [[unlikely]]
                    throw err_not_block_mode_t {};
                break;
            case mode_requirement_t::execution:
                if (c.mode != challenge_mode_t::execution) [[unlikely]]
                    throw err_not_execution_mode_t {};
                break;
            default:
                throw error(fmt::format("unsupported mode requirement: {}", static_cast<int>(req)));
        }
        if (hash_state(selection) != c.challenge_state_hash) [[unlikely]]
            throw err_state_mismatch_t {};
        validate_selection(selection);
    }

    template<typename CFG>
    void state_machine_t<CFG>::complete_turn(challenge_t &c, const timestamp_t now)
    {
        if (!c.exists())
            return;
        c.current.time_left -= c.time_used_since_last_move(now);
        std::swap(c.current, c.next);
        c.last_move_timestamp = now;
    }

    template<typename CFG>
    round_t state_machine_t<CFG>::_commit(challenge_t &c, const uint64_t start, const uint64_t length, segments_t segments)
    {
        round_t round { start, length, std::move(segments) };
        round.state_hash = hash_state(round.start, round.length, round.segments);
        c.challenge_state_hash = round.state_hash;
        return round;
    }

    template<typename CFG>
    void state_machine_t<CFG>::_current_win(challenge_t &c, const timestamp_t now)
    {
        // no selection hashes to zero, so the loser can only run out of time
        c.challenge_state_hash = hash_t {};
        complete_turn(c, now);
    }

    template struct state_machine_t<config_prod>;
    template struct state_machine_t<config_tiny>;
}
