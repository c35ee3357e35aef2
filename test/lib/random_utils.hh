/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <algorithm>
#include <limits>
#include <random>
#include <string>

namespace tests::random {

inline std::default_random_engine& gen() {
    static thread_local std::default_random_engine the_gen(std::random_device{}());
    return the_gen;
}

template <typename T>
T get_int(T min = std::numeric_limits<T>::min(), T max = std::numeric_limits<T>::max()) {
    std::uniform_int_distribution<T> dist(min, max);
    return dist(gen());
}

inline std::string get_bytes(size_t n) {
    std::string ret(n, '\0');
    std::ranges::generate(ret, [] { return static_cast<char>(get_int<int>(0, 255)); });
    return ret;
}

inline std::string get_name(size_t n = 12) {
    static constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::string ret(n, '\0');
    std::ranges::generate(ret, [] { return alphabet[get_int<size_t>(0, alphabet.size() - 1)]; });
    return ret;
}

} // namespace tests::random
