/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "manager.hpp"
#include "test-fixtures.hpp"

namespace {
    using namespace arbiter;
    using namespace arbiter::challenge;

    template<typename CFG=config_prod>
    struct test_env_t {
        std::shared_ptr<manual_clock_t> clock = std::make_shared<manual_clock_t>();
        std::shared_ptr<recording_sink_t> sink = std::make_shared<recording_sink_t>();
        std::shared_ptr<mock_receiver_t> receiver = std::make_shared<mock_receiver_t>();
        std::shared_ptr<mock_prover_t> prover = std::make_shared<mock_prover_t>();
        bridge_ptr_t bridge = std::make_shared<bridge_t>();
        challenge_manager_t<CFG> mgr { clock, sink };

        test_env_t()
        {
            mgr.initialize(receiver, std::make_shared<sequencer_inbox_t>(), bridge, prover);
        }

        challenge_index_t create(const challenge_params_t &params=test_params())
        {
            return mgr.create_challenge(test_receiver, params);
        }
    };
}

suite arbiter_challenge_manager_suite = [] {
    "arbiter::challenge::manager"_test = [] {
        "initialization"_test = [] {
            expect(throws<arbiter::error>([] { challenge_manager_t<config_prod> m { nullptr }; }));
            auto clock = std::make_shared<manual_clock_t>();
            challenge_manager_t<config_prod> m { clock };
            expect(!m.initialized());
            const auto s0 = initial_segments(test_params());
            const segment_selection_t sel { 0, 8, s0, 0 };
            expect(throws<err_not_initialized_t>([&] { static_cast<void>(m.create_challenge(test_receiver, test_params())); }));
            expect(throws<err_not_initialized_t>([&] { m.bisect_execution(test_challenger, 1, sel, block_bisection(s0, 0, 8)); }));
            expect(throws<err_not_initialized_t>([&] {
                m.challenge_execution(test_challenger, 1, sel, { machine_status_t::finished, machine_status_t::finished }, {}, 1);
            }));
            expect(throws<err_not_initialized_t>([&] { m.one_step_prove_execution(test_challenger, 1, sel, {}); }));
            expect(throws<err_not_initialized_t>([&] { m.timeout(1); }));
            expect(throws<err_not_initialized_t>([&] { m.clear_challenge(test_receiver, 1); }));
            expect(throws<err_no_result_receiver_t>([&] { m.initialize(nullptr, nullptr, nullptr, nullptr); }));
            expect(!m.initialized());
            const auto receiver = std::make_shared<mock_receiver_t>();
            m.initialize(receiver, nullptr, nullptr, nullptr);
            expect(m.initialized());
            expect(throws<err_already_initialized_t>([&] { m.initialize(receiver, nullptr, nullptr, nullptr); }));
            // system time source and no event sink
            challenge_manager_t<config_prod> sys { std::make_shared<system_time_source_t>() };
            sys.initialize(receiver, nullptr, nullptr, nullptr);
            const auto idx = sys.create_challenge(test_receiver, test_params());
            expect_equal(challenge_mode_t::block, sys.challenge_info(idx).mode);
            expect(!sys.is_timed_out(idx));
        };
        "create"_test = [] {
            test_env_t env {};
            expect(throws<err_not_result_receiver_t>([&] { static_cast<void>(env.mgr.create_challenge(test_outsider, test_params())); }));
            expect(throws<err_not_result_receiver_t>([&] { static_cast<void>(env.mgr.create_challenge(test_challenger, test_params())); }));
            expect_equal(uint64_t { 0 }, env.mgr.total_challenges_created());
            expect(throws<err_challenge_too_short_t>([&] { static_cast<void>(env.create(test_params(0))); }));
            expect_equal(uint64_t { 0 }, env.mgr.total_challenges_created());
            expect_equal(challenge_index_t { 1 }, env.create());
            expect_equal(challenge_index_t { 2 }, env.create());
            expect_equal(uint64_t { 2 }, env.mgr.total_challenges_created());
            const auto &c = env.mgr.challenge_info(1);
            expect_equal(challenge_mode_t::block, c.mode);
            expect_equal(test_challenger, env.mgr.current_responder(1));
            expect_equal(hash_state(0, 8, initial_segments(test_params())), c.challenge_state_hash);
            const std::vector<std::string> expected {
                "initiated 1", "bisected 1 0 8 2",
                "initiated 2", "bisected 2 0 8 2"
            };
            expect(env.sink->events == expected);
        };
        "unknown challenges"_test = [] {
            test_env_t env {};
            const auto s0 = initial_segments(test_params());
            expect(!env.mgr.challenge_info(0).exists());
            expect(!env.mgr.challenge_info(42).exists());
            expect_equal(address_t {}, env.mgr.current_responder(42));
            expect(!env.mgr.is_timed_out(42));
            expect(throws<err_no_challenge_t>([&] { env.mgr.bisect_execution(test_challenger, 1, { 0, 8, s0, 0 }, block_bisection(s0, 0, 8)); }));
            expect(throws<err_no_challenge_t>([&] { env.mgr.timeout(1); }));
            expect(throws<err_no_challenge_t>([&] { env.mgr.clear_challenge(test_receiver, 0); }));
        };
        "full challenge"_test = [] {
            test_env_t env {};
            const auto params = test_params();
            const auto idx = env.create();
            const auto s0 = initial_segments(params);
            const auto b1 = block_bisection(s0, 0, 8);
            env.clock->value = 1010;
            env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, b1);
            expect_equal(test_asserter, env.mgr.current_responder(idx));
            env.clock->value = 1020;
            const auto gsh0 = params.global_states[0].hash();
            env.mgr.challenge_execution(test_asserter, idx, { 0, 8, b1, 0 },
                { machine_status_t::finished, machine_status_t::finished }, { gsh0, filled_hash(0x77) }, 1);
            expect_equal(challenge_mode_t::execution, env.mgr.challenge_info(idx).mode);
            const segments_t e0 {
                hash_start_machine(gsh0, test_module_root),
                hash_end_machine(machine_status_t::finished, filled_hash(0x77))
            };
            env.clock->value = 1030;
            env.prover->result = e0[1];
            expect(throws<err_same_proof_end_t>([&] { env.mgr.one_step_prove_execution(test_challenger, idx, { 0, 1, e0, 0 }, {}); }));
            expect_equal(hash_state(0, 1, e0), env.mgr.challenge_info(idx).challenge_state_hash);
            env.prover->result = filled_hash(0x99);
            env.mgr.one_step_prove_execution(test_challenger, idx, { 0, 1, e0, 0 }, {});
            expect_equal(uint64_t { 5 }, env.prover->last_ctx.max_inbox_messages);
            expect(env.prover->last_ctx.bridge == env.bridge.get());
            expect(env.mgr.challenge_info(idx).challenge_state_hash.is_zero());
            expect_equal(test_asserter, env.mgr.current_responder(idx));
            expect(env.receiver->completed.empty());

            // the loser cannot respond and eventually runs out of time
            expect(throws<err_state_mismatch_t>([&] { env.mgr.one_step_prove_execution(test_asserter, idx, { 0, 1, e0, 0 }, {}); }));
            expect(throws<err_not_timed_out_t>([&] { env.mgr.timeout(idx); }));
            env.clock->value = 1030 + 991;
            expect(env.mgr.is_timed_out(idx));
            env.mgr.timeout(idx);
            expect(env.receiver->completed == std::vector<completion_t> { { idx, test_challenger, test_asserter } });
            expect(!env.mgr.challenge_info(idx).exists());
            expect(throws<err_no_challenge_t>([&] { env.mgr.timeout(idx); }));
            expect_equal(size_t { 1 }, env.receiver->completed.size());

            const std::vector<std::string> expected {
                "initiated 1",
                "bisected 1 0 8 2",
                "bisected 1 0 8 9",
                "bisected 1 0 1 2",
                "execution_begun 1 0",
                "one_step_proof_completed 1",
                "ended 1 timeout"
            };
            expect(env.sink->events == expected);
        };
        "timeout by a third party"_test = [] {
            test_env_t env {};
            const auto params = test_params(8, 1000, 100);
            const auto idx = env.create(params);
            const auto s0 = initial_segments(params);
            env.clock->value = 1150;
            const auto before = env.mgr.challenge_info(idx);
            expect(throws<err_deadline_passed_t>([&] {
                env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, block_bisection(s0, 0, 8));
            }));
            expect(env.mgr.challenge_info(idx) == before);
            env.mgr.timeout(idx);
            expect(env.receiver->completed == std::vector<completion_t> { { idx, test_asserter, test_challenger } });
            expect_equal(std::string { "ended 1 timeout" }, env.sink->events.back());
        };
        "block proof"_test = [] {
            test_env_t env {};
            const auto params = test_params();
            const auto idx = env.create(params);
            const auto s0 = initial_segments(params);
            auto b1 = block_bisection(s0, 0, 8);
            b1[1] = hash_block_state(machine_status_t::too_far, claimed_global_state(1));
            env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, b1);
            const auto h = claimed_global_state(1);
            env.mgr.challenge_execution(test_asserter, idx, { 0, 8, b1, 1 },
                { machine_status_t::too_far, machine_status_t::too_far }, { h, h }, 100);
            expect(env.mgr.challenge_info(idx).challenge_state_hash.is_zero());
            expect_equal(std::string { "bisected 1 0 8 9" }, env.sink->events.back());
            expect(env.receiver->completed.empty());
            env.clock->value = 5000;
            env.mgr.timeout(idx);
            expect(env.receiver->completed == std::vector<completion_t> { { idx, test_asserter, test_challenger } });
            const std::vector<std::string> expected_tail { "bisected 1 0 8 9", "ended 1 timeout" };
            expect(std::vector<std::string>(env.sink->events.end() - 2, env.sink->events.end()) == expected_tail);
        };
        "execution begun at the contested block"_test = [] {
            test_env_t env {};
            const auto params = test_params();
            const auto idx = env.create(params);
            const auto s0 = initial_segments(params);
            const auto b1 = block_bisection(s0, 0, 8);
            env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, b1);
            env.mgr.challenge_execution(test_asserter, idx, { 0, 8, b1, 3 },
                { machine_status_t::finished, machine_status_t::finished }, { claimed_global_state(3), filled_hash(0x77) }, 100);
            expect_equal(challenge_mode_t::execution, env.mgr.challenge_info(idx).mode);
            const std::vector<std::string> expected_tail { "bisected 1 0 100 2", "execution_begun 1 3" };
            expect(std::vector<std::string>(env.sink->events.end() - 2, env.sink->events.end()) == expected_tail);
        };
        "failed result notification"_test = [] {
            test_env_t env {};
            const auto params = test_params(8, 100, 100);
            const auto idx = env.create(params);
            env.clock->value = 1200;
            const auto before = env.mgr.challenge_info(idx);
            const auto num_events = env.sink->events.size();
            env.receiver->fail = true;
            expect(throws<arbiter::error>([&] { env.mgr.timeout(idx); }));
            expect(env.mgr.challenge_info(idx) == before);
            expect(env.mgr.is_timed_out(idx));
            expect_equal(num_events, env.sink->events.size());
            expect(env.receiver->completed.empty());
            env.receiver->fail = false;
            env.mgr.timeout(idx);
            expect(env.receiver->completed == std::vector<completion_t> { { idx, test_asserter, test_challenger } });
            expect(!env.mgr.challenge_info(idx).exists());
            expect_equal(std::string { "ended 1 timeout" }, env.sink->events.back());
        };
        "clear"_test = [] {
            test_env_t env {};
            const auto idx = env.create();
            expect(throws<err_not_result_receiver_t>([&] { env.mgr.clear_challenge(test_asserter, idx); }));
            expect(env.mgr.challenge_info(idx).exists());
            env.mgr.clear_challenge(test_receiver, idx);
            expect(!env.mgr.challenge_info(idx).exists());
            expect_equal(std::string { "ended 1 cleared" }, env.sink->events.back());
            expect(throws<err_no_challenge_t>([&] { env.mgr.clear_challenge(test_receiver, idx); }));
            const auto s0 = initial_segments(test_params());
            expect(throws<err_no_challenge_t>([&] {
                env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, block_bisection(s0, 0, 8));
            }));
            expect(env.receiver->completed.empty());
            expect_equal(challenge_index_t { 2 }, env.create());
        };
        "tiny configuration"_test = [] {
            test_env_t<config_tiny> env {};
            const auto idx = env.create();
            const auto s0 = initial_segments(test_params());
            expect(throws<err_wrong_degree_t>([&] {
                env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, block_bisection(s0, 0, 8));
            }));
            env.mgr.bisect_execution(test_challenger, idx, { 0, 8, s0, 0 }, block_bisection(s0, 0, 4));
            expect_equal(std::string { "bisected 1 0 8 5" }, env.sink->events.back());
        };
    };
};
