/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cstdio>
#include <cstdlib>
#include <limits>
#include <random>
#include <sys/wait.h>
#include <boost/test/unit_test.hpp>
#include <fmt/format.h>

#include "test/lib/unshare.hh"

unshare_fixture::unshare_fixture() {
    if (std::getenv("RUN_IN_UNSHARE")) {
        int status = std::system("ip link set lo up");
        if (WIFEXITED(status)) {
            if (int exit_status = WEXITSTATUS(status); exit_status == 0) {
                BOOST_TEST_MESSAGE("The network namespace was unshared");
                return;
            }
        }
        fmt::print(stderr, "failed to setup lo: {}\n", status);
    } else {
        BOOST_TEST_MESSAGE("Cant unshare network namespace. Randomizing addresses and ports");
        get_port = [] {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<uint16_t> ports(std::numeric_limits<int16_t>::max(), std::numeric_limits<uint16_t>::max());
            return ports(gen);
        };
        get_address = [] {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<uint16_t> octet(1, 254);
            return fmt::format("127.{}.{}.{}", octet(gen), octet(gen), octet(gen));
        };
    }
}
