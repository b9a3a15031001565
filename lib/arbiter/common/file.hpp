#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <string_view>
#include "bytes.hpp"

namespace arbiter::file {
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
    extern std::string install_path(std::string_view rel_path);

    // Removes the file when the object goes out of scope
    struct tmp {
        explicit tmp(std::string_view name);
        ~tmp();
        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
