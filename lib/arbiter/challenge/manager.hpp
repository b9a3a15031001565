#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "interfaces.hpp"
#include "registry.hpp"
#include "state-machine.hpp"

namespace arbiter::challenge {
    /*
     * Hosts all challenges opened by a single result receiver.
     * Mutating calls are rejected until initialize has been called exactly once.
     * Not thread safe: callers must serialize access.
     */
    template<typename CFG=config_prod>
    struct challenge_manager_t {
        using state_machine_type = state_machine_t<CFG>;

        explicit challenge_manager_t(time_source_ptr_t time_source, event_sink_ptr_t events={});

        void initialize(result_receiver_ptr_t result_receiver, sequencer_inbox_ptr_t sequencer_inbox,
            bridge_ptr_t bridge, one_step_prover_ptr_t prover);

        [[nodiscard]] bool initialized() const noexcept
        {
            return static_cast<bool>(_result_receiver);
        }

        [[nodiscard]] challenge_index_t create_challenge(const address_t &caller, const challenge_params_t &params);
        void bisect_execution(const address_t &caller, challenge_index_t index,
            const segment_selection_t &selection, const segments_t &new_segments);
        void challenge_execution(const address_t &caller, challenge_index_t index, const segment_selection_t &selection,
            const machine_statuses_t &statuses, const state_hashes_t &global_state_hashes, uint64_t num_steps);
        void one_step_prove_execution(const address_t &caller, challenge_index_t index,
            const segment_selection_t &selection, buffer proof);
        // Callable by anyone
        void timeout(challenge_index_t index);
        void clear_challenge(const address_t &caller, challenge_index_t index);

        [[nodiscard]] const challenge_t &challenge_info(challenge_index_t index) const noexcept;
        [[nodiscard]] const address_t &current_responder(challenge_index_t index) const noexcept;
        [[nodiscard]] bool is_timed_out(challenge_index_t index) const;

        [[nodiscard]] uint64_t total_challenges_created() const noexcept
        {
            return _registry.total_created();
        }
    private:
        time_source_ptr_t _time;
        event_sink_ptr_t _events;
        result_receiver_ptr_t _result_receiver {};
        sequencer_inbox_ptr_t _sequencer_inbox {};
        bridge_ptr_t _bridge {};
        one_step_prover_ptr_t _prover {};
        registry_t _registry {};

        void _require_initialized() const;
        void _require_result_receiver(const address_t &caller) const;
        void _notify_ended(challenge_index_t index, termination_type_t kind) const;
        void _notify_round(challenge_index_t index, const round_t &round) const;

        template<typename F>
        auto _run_move(std::string_view name, challenge_index_t index, const F &action) -> decltype(action());
    };
}
