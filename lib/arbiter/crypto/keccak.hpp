#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <arbiter/common/bytes.hpp>

namespace arbiter::crypto::keccak
{
    using hash_t = byte_array<32>;

    // Keccak-256 with the original (pre-SHA3) padding as used by Ethereum
    extern void digest(hash_t &out, const buffer &in);

    template<typename T=hash_t>
    T digest(const buffer &in)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        T out;
        digest(out, in);
        return out;
    }
}
