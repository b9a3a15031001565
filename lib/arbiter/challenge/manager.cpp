/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <arbiter/common/logger.hpp>
#include "errors.hpp"
#include "manager.hpp"

namespace arbiter::challenge {
    template<typename CFG>
    challenge_manager_t<CFG>::challenge_manager_t(time_source_ptr_t time_source, event_sink_ptr_t events):
        _time { std::move(time_source) },
        _events { std::move(events) }
    {
        if (!_time) [[unlikely]]
            throw error("challenge_manager_t requires a time source!");
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::initialize(result_receiver_ptr_t result_receiver, sequencer_inbox_ptr_t sequencer_inbox,
        bridge_ptr_t bridge, one_step_prover_ptr_t prover)
    {
        if (initialized()) [[unlikely]]
            throw err_already_initialized_t {};
        if (!result_receiver) [[unlikely]]
            throw err_no_result_receiver_t {};
        _result_receiver = std::move(result_receiver);
        _sequencer_inbox = std::move(sequencer_inbox);
        _bridge = std::move(bridge);
        _prover = std::move(prover);
        logger::info("challenge manager initialized with result receiver {}", _result_receiver->address());
    }

    template<typename CFG>
    challenge_index_t challenge_manager_t<CFG>::create_challenge(const address_t &caller, const challenge_params_t &params)
    {
        return _run_move("create_challenge", no_challenge_index, [&] {
            _require_initialized();
            _require_result_receiver(caller);
            auto [c, round] = state_machine_type::create(params, _time->now());
            const auto index = _registry.allocate();
            _registry.at(index) = std::move(c);
            logger::info("challenge {} created: asserter: {} challenger: {} blocks: {}",
                index, params.asserter, params.challenger, params.num_blocks);
            if (_events)
                _events->initiated(index, params.global_states[0], params.global_states[1]);
            _notify_round(index, round);
            return index;
        });
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::bisect_execution(const address_t &caller, const challenge_index_t index,
        const segment_selection_t &selection, const segments_t &new_segments)
    {
        _run_move("bisect_execution", index, [&] {
            _require_initialized();
            const auto round = state_machine_type::bisect(_registry.at(index), caller, _time->now(), selection, new_segments);
            _notify_round(index, round);
        });
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::challenge_execution(const address_t &caller, const challenge_index_t index,
        const segment_selection_t &selection, const machine_statuses_t &statuses, const state_hashes_t &global_state_hashes,
        const uint64_t num_steps)
    {
        _run_move("challenge_execution", index, [&] {
            _require_initialized();
            const auto round = state_machine_type::challenge_execution(_registry.at(index), caller, _time->now(),
                selection, statuses, global_state_hashes, num_steps);
            if (!round) {
                // the record stays live until the loser times out
                logger::info("challenge {}: the start block state is not finished, the current responder {} wins",
                    index, caller);
                return;
            }
            const auto block_start = extract_segment(selection).start;
            logger::info("challenge {}: execution challenge begun at block {} over {} steps", index, block_start, num_steps);
            _notify_round(index, *round);
            if (_events)
                _events->execution_begun(index, block_start);
        });
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::one_step_prove_execution(const address_t &caller, const challenge_index_t index,
        const segment_selection_t &selection, const buffer proof)
    {
        _run_move("one_step_prove_execution", index, [&] {
            _require_initialized();
            if (!_prover) [[unlikely]]
                throw error("no one-step prover has been configured!");
            const execution_context_t ctx { _registry.at(index).max_inbox_messages, _bridge.get() };
            state_machine_type::one_step_prove(_registry.at(index), caller, _time->now(), selection, proof, *_prover, ctx);
            logger::info("challenge {}: one-step proof by {} accepted", index, caller);
            if (_events)
                _events->one_step_proof_completed(index);
        });
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::timeout(const challenge_index_t index)
    {
        _run_move("timeout", index, [&] {
            _require_initialized();
            const auto &c = static_cast<const registry_t &>(_registry).at(index);
            const auto res = state_machine_type::timeout(c, _time->now());
            auto saved = c;
            _registry.erase(index);
            logger::info("challenge {} timed out: winner: {} loser: {}", index, res.winner, res.loser);
            try {
                logger::run_log_errors_rethrow([&] {
                    _result_receiver->complete_challenge(index, res.winner, res.loser);
                });
            } catch (...) {
                // a failed notification rejects the whole call
                _registry.at(index) = std::move(saved);
                throw;
            }
            _notify_ended(index, termination_type_t::timeout);
        });
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::clear_challenge(const address_t &caller, const challenge_index_t index)
    {
        _run_move("clear_challenge", index, [&] {
            _require_initialized();
            _require_result_receiver(caller);
            state_machine_type::clear(static_cast<const registry_t &>(_registry).at(index));
            _registry.erase(index);
            logger::info("challenge {} cleared", index);
            _notify_ended(index, termination_type_t::cleared);
        });
    }

    template<typename CFG>
    const challenge_t &challenge_manager_t<CFG>::challenge_info(const challenge_index_t index) const noexcept
    {
        return _registry.at(index);
    }

    template<typename CFG>
    const address_t &challenge_manager_t<CFG>::current_responder(const challenge_index_t index) const noexcept
    {
        return _registry.at(index).current.addr;
    }

    template<typename CFG>
    bool challenge_manager_t<CFG>::is_timed_out(const challenge_index_t index) const
    {
        const auto &c = _registry.at(index);
        return c.exists() && c.is_timed_out(_time->now());
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::_require_initialized() const
    {
        if (!initialized()) [[unlikely]]
            throw err_not_initialized_t {};
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::_require_result_receiver(const address_t &caller) const
    {
        if (caller != _result_receiver->address()) [[unlikely]]
            throw err_not_result_receiver_t {};
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::_notify_ended(const challenge_index_t index, const termination_type_t kind) const
    {
        logger::debug("challenge {} ended: {}", index, kind);
        if (_events)
            _events->ended(index, kind);
    }

    template<typename CFG>
    void challenge_manager_t<CFG>::_notify_round(const challenge_index_t index, const round_t &round) const
    {
        logger::debug("challenge {}: committed {} segments over [{}, {}) state hash: {}",
            index, round.segments.size(), round.start, round.start + round.length, round.state_hash);
        if (_events)
            _events->bisected(index, round.state_hash, round.start, round.length, round.segments);
    }

    template<typename CFG>
    template<typename F>
    auto challenge_manager_t<CFG>::_run_move(const std::string_view name, const challenge_index_t index, const F &action) -> decltype(action())
    {
        try {
            return action();
        } catch (const challenge_error &ex) {
            logger::debug("challenge {}: {} rejected: {}", index, name, ex.what());
            throw;
        }
    }

    template struct challenge_manager_t<config_prod>;
    template struct challenge_manager_t<config_tiny>;
}
