#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include "types.hpp"

namespace arbiter::challenge {
    /*
     * An arena of challenge records addressed by monotonically increasing indices.
     * A deleted slot is reset to the default record and its index is never reused.
     */
    struct registry_t {
        registry_t();

        [[nodiscard]] challenge_index_t allocate();
        void erase(challenge_index_t index);

        // Returns the default record for indices that were never allocated
        [[nodiscard]] const challenge_t &at(challenge_index_t index) const noexcept;
        // Throws err_no_challenge_t for indices that were never allocated
        [[nodiscard]] challenge_t &at(challenge_index_t index);

        [[nodiscard]] uint64_t total_created() const noexcept
        {
            return static_cast<uint64_t>(_challenges.size() - 1);
        }
    private:
        static const challenge_t _empty;
        std::vector<challenge_t> _challenges {};
    };
}
