/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <arbiter/common/test.hpp>
#include "errors.hpp"
#include "hashing.hpp"
#include "segments.hpp"

namespace {
    using namespace arbiter;
    using namespace arbiter::challenge;

    hash_t filled(const uint8_t b)
    {
        hash_t h {};
        h.fill(b);
        return h;
    }

    const global_state_t test_state { filled(0x11), filled(0x22), 7, 3 };
}

suite arbiter_challenge_hashing_suite = [] {
    "arbiter::challenge::hashing"_test = [] {
        "global state"_test = [] {
            expect_equal(hash_t::from_hex("360F98319F3651E9871CB55319F743F4E9A5D60A870FED27B09B02AAD9214E07"), global_state_t {}.hash());
            expect_equal(hash_t::from_hex("427D7322F5369DDB2B60A95848436A6392B47D5D12B4C8EB8642A17B024BE5FB"), test_state.hash());
            expect(global_state_t {}.empty());
            expect(!test_state.empty());
        };
        "value"_test = [] {
            expect_equal(hash_t::from_hex("9CCDA813F0E39B3D49ACCF7A545146E89E797DA8253444835A5B35F9F0419B62"), value_t::new_ref_null().hash());
            expect(value_t::new_ref_null().hash() != value_t::new_i32(0).hash());
            expect_equal(hash_t {}, value_stack_t {}.hash());
            expect_equal(hash_t {}, stack_frame_window_t {}.hash());
        };
        "start machine"_test = [] {
            const auto gsh = test_state.hash();
            const auto root = filled(0xAB);
            const auto h = hash_start_machine(gsh, root);
            expect_equal(hash_t::from_hex("5C9CD8C79782B119C0DB0704796CF97B3668D09045336DA0A54CB0A27F8808C2"), h);
            expect_equal(h, machine_t::start(gsh, root).hash());
            expect(h != hash_start_machine(gsh, filled(0xAC)));
            expect(h != hash_start_machine(global_state_t {}.hash(), root));
        };
        "end machine"_test = [] {
            const auto gsh = test_state.hash();
            expect_equal(hash_t::from_hex("CD0BEF4DE93C5485146D076C691907D5723680041DF7E6B76B5C86AFF1643197"), hash_end_machine(machine_status_t::finished, gsh));
            expect_equal(hash_t::from_hex("946A06AC8584F720F99F6C452A12DD14E4C18E08CA5C4D94AEE84A938387AF9D"), hash_end_machine(machine_status_t::errored, gsh));
            expect_equal(hash_t::from_hex("D8DD08A325ECC4277AA69E9F45EE37572346BFA062708DBAD442CBB16C6FC75B"), hash_end_machine(machine_status_t::too_far, gsh));
            // errored and too-far machines commit to the status only
            expect_equal(hash_end_machine(machine_status_t::errored, gsh), hash_end_machine(machine_status_t::errored, {}));
            expect_equal(hash_end_machine(machine_status_t::too_far, gsh), hash_end_machine(machine_status_t::too_far, {}));
            expect(throws<err_invalid_status_t>([&] { static_cast<void>(hash_end_machine(machine_status_t::running, gsh)); }));
            expect(throws<err_invalid_status_t>([&] { static_cast<void>(hash_end_machine(machine_status_t::blocked, gsh)); }));
            machine_t finished {};
            finished.status = machine_status_t::finished;
            finished.global_state_hash = gsh;
            expect_equal(hash_end_machine(machine_status_t::finished, gsh), finished.hash());
            machine_t blocked {};
            blocked.status = machine_status_t::blocked;
            expect(throws<err_invalid_status_t>([&] { static_cast<void>(blocked.hash()); }));
        };
        "block state"_test = [] {
            const auto gsh = test_state.hash();
            expect_equal(hash_t::from_hex("9B596F7296F7DF81C795A207D7C40FDE9578C9FA1D32256F9033B4DEE64E1354"), hash_block_state(machine_status_t::finished, gsh));
            expect_equal(hash_t::from_hex("EDC07923218D61601BC0A833D500226738B8522E9CA8935057C060FFC2EBF1B7"), hash_block_state(machine_status_t::errored, gsh));
            expect_equal(hash_t::from_hex("0296B8F67EAB80341C005DE6DAA6877E62B998234427899FDA27751053FB5576"), hash_block_state(machine_status_t::too_far, gsh));
            expect(hash_block_state(machine_status_t::errored, gsh) != hash_block_state(machine_status_t::errored, {}));
            expect(throws<err_invalid_status_t>([&] { static_cast<void>(hash_block_state(machine_status_t::running, gsh)); }));
            expect(throws<err_invalid_status_t>([&] { static_cast<void>(hash_block_state(machine_status_t::blocked, gsh)); }));
        };
        "domain separation"_test = [] {
            const auto gsh = test_state.hash();
            expect(hash_block_state(machine_status_t::finished, gsh) != hash_end_machine(machine_status_t::finished, gsh));
            expect(hash_block_state(machine_status_t::too_far, gsh) != hash_end_machine(machine_status_t::too_far, gsh));
            expect(hash_block_state(machine_status_t::finished, gsh) != hash_block_state(machine_status_t::errored, gsh));
        };
        "round commitment"_test = [] {
            const segments_t segs {
                hash_block_state(machine_status_t::finished, global_state_t {}.hash()),
                hash_block_state(machine_status_t::finished, test_state.hash())
            };
            expect_equal(hash_t::from_hex("096CA535256CBA63D3D5224F0607653BCE5692C3D80566F9A80E01E3C6CCEC7C"), hash_state(0, 8, segs));
            expect(hash_state(0, 8, segs) != hash_state(1, 8, segs));
            expect(hash_state(0, 8, segs) != hash_state(0, 9, segs));
        };
    };
};
