/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <arbiter/common/numeric-cast.hpp>
#include "errors.hpp"
#include "registry.hpp"

namespace arbiter::challenge {
    const challenge_t registry_t::_empty {};

    registry_t::registry_t():
        _challenges(1)
    {
    }

    challenge_index_t registry_t::allocate()
    {
        _challenges.emplace_back();
        return numeric_cast<challenge_index_t>(_challenges.size() - 1);
    }

    void registry_t::erase(const challenge_index_t index)
    {
        at(index) = challenge_t {};
    }

    const challenge_t &registry_t::at(const challenge_index_t index) const noexcept
    {
        if (index == no_challenge_index || index >= _challenges.size()) [[unlikely]]
            return _empty;
        return _challenges[index];
    }

    challenge_t &registry_t::at(const challenge_index_t index)
    {
        if (index == no_challenge_index || index >= _challenges.size()) [[unlikely]]
            throw err_no_challenge_t {};
        return _challenges[index];
    }
}
