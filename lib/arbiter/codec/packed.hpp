#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <ranges>
#include <arbiter/common/bytes.hpp>
#include <arbiter/crypto/keccak.hpp>
#include "serializable.hpp"

/*
 * Tightly packed encoding used for commitments: integers are written as fixed-width
 * big-endian values, byte arrays and labels are written as-is with no length prefixes.
 */
namespace arbiter::codec::packed {
    // A 256-bit unsigned integer with the upper 192 bits equal to zero
    struct uint256_t {
        uint64_t val = 0;
    };

    struct encoder;

    template<typename T>
    concept to_packed_c = requires(const T t, encoder &enc)
    {
        { t.to_packed(enc) };
    };

    template<typename T>
    inline constexpr bool unsupported_type_v = false;

    struct encoder {
        static void uint_fixed(const std::span<uint8_t> &bytes, const uint64_t val)
        {
            if (bytes.empty()) [[unlikely]]
                throw error("packed::encoder: uint_fixed: the output buffer must not be empty!");
            auto x = val;
            for (size_t i = bytes.size(); i > 0; --i) {
                bytes[i - 1] = static_cast<uint8_t>(x & 0xFF);
                x >>= 8;
            }
            if (x) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded as a sequence of {} bytes", val, bytes.size()));
        }

        template<typename ...Args>
        explicit encoder(const Args &... args)
        {
            (process(args), ...);
        }

        void uint_fixed(const size_t num_bytes, const uint64_t val)
        {
            _bytes.resize(_bytes.size() + num_bytes);
            uint_fixed(std::span { _bytes.data() + _bytes.size() - num_bytes, num_bytes }, val);
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _bytes << bytes;
        }

        void process_label(const std::string_view label)
        {
            _bytes << buffer { label };
        }

        template<typename T>
        void process(const T &val)
        {
            if constexpr (to_packed_c<T>) {
                val.to_packed(*this);
            } else if constexpr (byte_array_c<T>) {
                process_bytes_fixed(val);
            } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
                process_label(val);
            } else if constexpr (std::is_same_v<T, uint256_t>) {
                uint_fixed(32, val.val);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                uint_fixed(8, val);
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                uint_fixed(4, val);
            } else if constexpr (std::is_same_v<T, uint8_t>) {
                uint_fixed(1, val);
            } else if constexpr (named_enum_c<T>) {
                static_assert(sizeof(T) == 1);
                uint_fixed(1, static_cast<uint8_t>(val));
            } else if constexpr (std::ranges::input_range<T>) {
                for (const auto &v: val)
                    process(v);
            } else {
                static_assert(unsupported_type_v<T>, "packed encoding is not enabled for this type");
            }
        }

        [[nodiscard]] buffer bytes() const noexcept
        {
            return _bytes;
        }

        [[nodiscard]] crypto::keccak::hash_t digest() const
        {
            return crypto::keccak::digest(_bytes);
        }
    private:
        uint8_vector _bytes {};
    };

    template<typename ...Args>
    crypto::keccak::hash_t digest(const Args &... args)
    {
        return encoder { args... }.digest();
    }
}
