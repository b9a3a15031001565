#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <limits>
#include <boost/json.hpp>
#include <arbiter/common/bytes.hpp>
#include "serializable.hpp"

namespace arbiter::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(T t, boost::json::value jv)
    {
        { T::from_json(jv) };
    };

    template<typename T>
    concept optional_c = requires(T t)
    {
        { t.reset() };
        { t.emplace() };
    };

    extern value parse(const buffer &buf);
    extern value load(const std::string &path);

    struct decoder: archive_t {
        decoder(const boost::json::value &jv)
        {
            _vals.emplace_back(jv);
        }

        template<typename T>
        static void decode(const boost::json::value &jv, T &val)
        {
            if constexpr (from_json_c<T>) {
                val = T::from_json(jv);
            } else if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (byte_array_c<T>) {
                decode_bytes_fixed(jv, val);
            } else if constexpr (named_enum_c<T>) {
                if (jv.is_string()) {
                    val = enum_from_name<T>(boost::json::value_to<std::string_view>(jv));
                } else {
                    const auto idx = boost::json::value_to<uint64_t>(jv);
                    if (idx >= enum_names<T>::names.size()) [[unlikely]]
                        throw error(fmt::format("an out of range value {} for enum {}", idx, typeid(T).name()));
                    val = static_cast<T>(idx);
                }
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, int64_t>
                    || std::is_same_v<T, bool>) {
                val = boost::json::value_to<T>(jv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                val = boost::json::value_to<std::string_view>(jv);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                decode_bytes(jv, val);
            } else if constexpr (optional_c<T>) {
                decode(jv, val.emplace());
            } else if constexpr (fixed_sequence_c<T>) {
                decoder dec { jv };
                dec.process_array_fixed(val);
            } else if constexpr (sequence_c<T>) {
                decoder dec { jv };
                dec.process_array(val);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        static void decode_bytes_fixed(const boost::json::value &jv, std::span<uint8_t> bytes)
        {
            const auto hex = boost::json::value_to<std::string_view>(jv);
            if (!hex.starts_with("0x")) [[unlikely]]
                throw error(fmt::format("expected a hex string but got: {}", hex));
            init_from_hex(bytes, hex.substr(2));
        }

        static void decode_bytes(const boost::json::value &jv, uint8_vector &bytes)
        {
            const auto hex = boost::json::value_to<std::string_view>(jv);
            if (!hex.starts_with("0x")) [[unlikely]]
                throw error(fmt::format("expected a hex string but got: {}", hex));
            bytes = uint8_vector::from_hex(hex);
        }

        void push(const std::string_view name)
        {
            _vals.emplace_back(_top().at(name));
        }

        void pop()
        {
            if (_vals.size() == 1) [[unlikely]]
                throw error("cannot pop the top element!");
            _vals.pop_back();
        }

        void process(auto &val)
        {
            decode(_top(), val);
        }

        void process(const std::string_view name, auto &val)
        {
            using T = std::decay_t<decltype(val)>;
            const auto &jo = _top().as_object();
            const auto it = jo.find(name);
            if (it != jo.end()) {
                decode(it->value(), val);
            } else {
                if constexpr (optional_c<T>) {
                    val.reset();
                } else {
                    throw error(fmt::format("a required field '{}' is missing: {}", name, boost::json::serialize(jo)));
                }
            }
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto &j_arr = _top().as_array();
            if (!(static_cast<int>(j_arr.size() >= min_sz) & static_cast<int>(j_arr.size() <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", j_arr.size(), min_sz, max_sz));
            self.clear();
            self.reserve(j_arr.size());
            for (const auto &jv: j_arr) {
                typename T::value_type v {};
                decode(jv, v);
                self.emplace_back(std::move(v));
            }
        }

        void process_array_fixed(auto &self)
        {
            const auto &j_arr = _top().as_array();
            if (j_arr.size() != self.size()) [[unlikely]]
                throw error(fmt::format("fixed array: expected size {} but got {}", self.size(), j_arr.size()));
            for (size_t i = 0; i < j_arr.size(); ++i) {
                decode(j_arr[i], self[i]);
            }
        }
    private:
        std::vector<std::reference_wrapper<const boost::json::value>> _vals {};

        const boost::json::value &_top() const
        {
            return _vals.back().get();
        }
    };

    template<typename T>
    T parse_obj(const boost::json::value &j)
    {
        if constexpr (from_json_c<T>) {
            return T::from_json(j);
        } else if constexpr (codec::serializable_c<T>) {
            decoder j_dec { j };
            return codec::from<T>(j_dec);
        } else {
            throw error(fmt::format("JSON serialization not supported for {}", typeid(T).name()));
        }
    }

    template<typename T>
    T load_obj(const std::string &path)
    {
        return parse_obj<T>(load(path));
    }
}
