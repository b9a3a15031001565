#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <string_view>
#include <arbiter/codec/serializable.hpp>
#include <arbiter/common/error.hpp>

namespace arbiter::challenge {
    // Every rejected call leaves the challenge unchanged regardless of the category
    enum class error_category_t: uint8_t {
        access_violation = 0,
        state_mismatch = 1,
        invalid_transition = 2,
        degenerate_selection = 3,
        timed_out = 4,
        same_endpoint = 5,
        invalid_status = 6,
        invalid_argument = 7
    };

    struct challenge_error: error {
        challenge_error(const std::string_view msg, const error_category_t category):
            error { msg },
            _category { category }
        {
        }

        [[nodiscard]] error_category_t category() const noexcept
        {
            return _category;
        }
    private:
        error_category_t _category;
    };

    struct err_not_initialized_t final: challenge_error {
        err_not_initialized_t(): challenge_error { "err_not_initialized_t", error_category_t::access_violation } {}
        bool operator==(const err_not_initialized_t &) const { return true; }
    };
    struct err_already_initialized_t final: challenge_error {
        err_already_initialized_t(): challenge_error { "err_already_initialized_t", error_category_t::invalid_transition } {}
        bool operator==(const err_already_initialized_t &) const { return true; }
    };
    struct err_no_result_receiver_t final: challenge_error {
        err_no_result_receiver_t(): challenge_error { "err_no_result_receiver_t", error_category_t::invalid_argument } {}
        bool operator==(const err_no_result_receiver_t &) const { return true; }
    };
    struct err_not_result_receiver_t final: challenge_error {
        err_not_result_receiver_t(): challenge_error { "err_not_result_receiver_t", error_category_t::access_violation } {}
        bool operator==(const err_not_result_receiver_t &) const { return true; }
    };
    struct err_not_current_responder_t final: challenge_error {
        err_not_current_responder_t(): challenge_error { "err_not_current_responder_t", error_category_t::access_violation } {}
        bool operator==(const err_not_current_responder_t &) const { return true; }
    };
    struct err_no_challenge_t final: challenge_error {
        err_no_challenge_t(): challenge_error { "err_no_challenge_t", error_category_t::invalid_transition } {}
        bool operator==(const err_no_challenge_t &) const { return true; }
    };
    struct err_not_block_mode_t final: challenge_error {
        err_not_block_mode_t(): challenge_error { "err_not_block_mode_t", error_category_t::invalid_transition } {}
        bool operator==(const err_not_block_mode_t &) const { return true; }
    };
    struct err_not_execution_mode_t final: challenge_error {
        err_not_execution_mode_t(): challenge_error { "err_not_execution_mode_t", error_category_t::invalid_transition } {}
        bool operator==(const err_not_execution_mode_t &) const { return true; }
    };
    struct err_not_timed_out_t final: challenge_error {
        err_not_timed_out_t(): challenge_error { "err_not_timed_out_t", error_category_t::invalid_transition } {}
        bool operator==(const err_not_timed_out_t &) const { return true; }
    };
    struct err_halted_change_t final: challenge_error {
        err_halted_change_t(): challenge_error { "err_halted_change_t", error_category_t::invalid_transition } {}
        bool operator==(const err_halted_change_t &) const { return true; }
    };
    struct err_error_change_t final: challenge_error {
        err_error_change_t(): challenge_error { "err_error_change_t", error_category_t::invalid_transition } {}
        bool operator==(const err_error_change_t &) const { return true; }
    };
    struct err_state_mismatch_t final: challenge_error {
        err_state_mismatch_t(): challenge_error { "err_state_mismatch_t", error_category_t::state_mismatch } {}
        bool operator==(const err_state_mismatch_t &) const { return true; }
    };
    struct err_wrong_start_t final: challenge_error {
        err_wrong_start_t(): challenge_error { "err_wrong_start_t", error_category_t::state_mismatch } {}
        bool operator==(const err_wrong_start_t &) const { return true; }
    };
    struct err_degenerate_selection_t final: challenge_error {
        err_degenerate_selection_t(): challenge_error { "err_degenerate_selection_t", error_category_t::degenerate_selection } {}
        bool operator==(const err_degenerate_selection_t &) const { return true; }
    };
    struct err_too_short_t final: challenge_error {
        err_too_short_t(): challenge_error { "err_too_short_t", error_category_t::degenerate_selection } {}
        bool operator==(const err_too_short_t &) const { return true; }
    };
    struct err_too_long_t final: challenge_error {
        err_too_long_t(): challenge_error { "err_too_long_t", error_category_t::degenerate_selection } {}
        bool operator==(const err_too_long_t &) const { return true; }
    };
    struct err_wrong_degree_t final: challenge_error {
        err_wrong_degree_t(): challenge_error { "err_wrong_degree_t", error_category_t::degenerate_selection } {}
        bool operator==(const err_wrong_degree_t &) const { return true; }
    };
    struct err_challenge_too_short_t final: challenge_error {
        err_challenge_too_short_t(): challenge_error { "err_challenge_too_short_t", error_category_t::invalid_argument } {}
        bool operator==(const err_challenge_too_short_t &) const { return true; }
    };
    struct err_challenge_too_long_t final: challenge_error {
        err_challenge_too_long_t(): challenge_error { "err_challenge_too_long_t", error_category_t::invalid_argument } {}
        bool operator==(const err_challenge_too_long_t &) const { return true; }
    };
    struct err_deadline_passed_t final: challenge_error {
        err_deadline_passed_t(): challenge_error { "err_deadline_passed_t", error_category_t::timed_out } {}
        bool operator==(const err_deadline_passed_t &) const { return true; }
    };
    struct err_same_end_t final: challenge_error {
        err_same_end_t(): challenge_error { "err_same_end_t", error_category_t::same_endpoint } {}
        bool operator==(const err_same_end_t &) const { return true; }
    };
    struct err_same_proof_end_t final: challenge_error {
        err_same_proof_end_t(): challenge_error { "err_same_proof_end_t", error_category_t::same_endpoint } {}
        bool operator==(const err_same_proof_end_t &) const { return true; }
    };
    struct err_invalid_status_t final: challenge_error {
        err_invalid_status_t(): challenge_error { "err_invalid_status_t", error_category_t::invalid_status } {}
        bool operator==(const err_invalid_status_t &) const { return true; }
    };
}

namespace arbiter::codec {
    template<>
    struct enum_names<challenge::error_category_t> {
        static constexpr std::array<std::string_view, 8> names {
            "access_violation", "state_mismatch", "invalid_transition", "degenerate_selection",
            "timed_out", "same_endpoint", "invalid_status", "invalid_argument"
        };
    };
}
