#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <concepts>
#include <tuple>
#include <span>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <arbiter/common/bytes.hpp>

namespace arbiter::codec {
    struct archive_t {
    };

    template<typename T>
    T from(auto &archive)
    {
        T res {};
        res.serialize(archive);
        return res;
    }

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    template<typename T>
    struct is_byte_array: std::false_type {
    };

    template<size_t SZ>
    struct is_byte_array<byte_array<SZ>>: std::true_type {
    };

    template<typename T>
    concept byte_array_c = is_byte_array<T>::value;

    template<typename T>
    concept sequence_c = requires(T t, typename T::value_type v)
    {
        { t.emplace_back(std::move(v)) };
        { t.clear() };
        { t.size() } -> std::convertible_to<size_t>;
    };

    template<typename T>
    concept fixed_sequence_c = !byte_array_c<T> && requires(T t)
    {
        { std::tuple_size<T>::value } -> std::convertible_to<size_t>;
        { t[0] };
    };

    // Specialize to give an enum textual names: the n-th name corresponds to the underlying value n
    template<typename T>
    struct enum_names;

    template<typename T>
    concept named_enum_c = std::is_enum_v<T> && requires
    {
        { enum_names<T>::names.size() } -> std::convertible_to<size_t>;
    };

    template<named_enum_c T>
    std::string_view enum_name(const T val)
    {
        const auto idx = static_cast<size_t>(val);
        const auto &names = enum_names<T>::names;
        if (idx >= names.size()) [[unlikely]]
            throw error(fmt::format("an out of range value {} for enum {}", idx, typeid(T).name()));
        return names[idx];
    }

    template<named_enum_c T>
    T enum_from_name(const std::string_view name)
    {
        const auto &names = enum_names<T>::names;
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name)
                return static_cast<T>(i);
        }
        throw error(fmt::format("an unsupported value '{}' for enum {}", name, typeid(T).name()));
    }
}

namespace fmt {
    template<arbiter::codec::named_enum_c T>
    struct formatter<T>: formatter<fmt::string_view> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<fmt::string_view>::format(arbiter::codec::enum_name(v), ctx);
        }
    };
}
