/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>

namespace fs = std::filesystem;

// Creates a new empty directory with arbitrary name, which will be removed
// automatically when the tmpdir object goes out of scope.
class tmpdir {
    fs::path _path;

    void remove();

public:
    tmpdir();
    tmpdir(tmpdir&&) noexcept;
    tmpdir(const tmpdir&) = delete;
    tmpdir& operator=(tmpdir&&) noexcept;
    tmpdir& operator=(const tmpdir&) = delete;
    ~tmpdir();

    const fs::path& path() const noexcept { return _path; }
};
