/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <filesystem>
#include "file.hpp"

namespace arbiter::file {
    uint8_vector read(const std::string &path)
    {
        std::FILE *f = std::fopen(path.c_str(), "rb");
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        uint8_vector data {};
        std::array<uint8_t, 0x4000> chunk {};
        for (;;) {
            const auto num_read = std::fread(chunk.data(), 1, chunk.size(), f);
            data << buffer { chunk.data(), num_read };
            if (num_read < chunk.size())
                break;
        }
        const bool failed = std::ferror(f) != 0;
        std::fclose(f);
        if (failed) [[unlikely]]
            throw error_sys(fmt::format("failed to read file {}", path));
        return data;
    }

    void write(const std::string &path, const buffer data)
    {
        std::FILE *f = std::fopen(path.c_str(), "wb");
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        const auto num_written = std::fwrite(data.data(), 1, data.size(), f);
        std::fclose(f);
        if (num_written != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }

    tmp::tmp(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }
}
