/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <iostream>
#include <arbiter/common/logger.hpp>
#include <arbiter/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace arbiter;
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const auto start = std::chrono::steady_clock::now();
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    const std::chrono::duration<double> took = std::chrono::steady_clock::now() - start;
    logger::info("run-test took {:.3f} secs, failed: {}", took.count(), failed);
    return failed ? 1 : 0;
}
