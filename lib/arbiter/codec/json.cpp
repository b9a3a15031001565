/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/json.hpp>
#include <arbiter/common/file.hpp>
#include "json.hpp"

namespace arbiter::codec::json {
    value parse(const buffer &buf)
    {
        return boost::json::parse(static_cast<std::string_view>(buf));
    }

    value load(const std::string &path)
    {
        try {
            return parse(file::read(path));
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load JSON from {}", path), ex);
        }
    }
}
