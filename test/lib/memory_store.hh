/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <seastar/core/semaphore.hh>

#include "replication/errors.hh"
#include "replication/object_store.hh"
#include "replication/retry_controller.hh"

namespace tests {

// Object store keeping everything in memory, with hooks to make any of its
// operations fail or stall on demand.
class memory_store final : public replication::object_store {
public:
    struct stored_object {
        std::string data;
        replication::object_metadata metadata;
        seastar::sstring fingerprint;
    };

private:
    struct fault {
        replication::error_kind kind;
        // Calls let through before the first failure.
        unsigned skip;
        // Unset fails forever.
        std::optional<unsigned> times;
    };

    class stream;
    class writer;

    replication::store_kind _kind;
    std::map<std::pair<seastar::sstring, seastar::sstring>, stored_object> _objects;
    std::array<std::optional<fault>, replication::operations_count> _faults;
    std::array<unsigned, replication::operations_count> _calls{};
    std::optional<replication::operation> _paused;
    seastar::semaphore _resume{0};
    bool _resumable = true;
    bool _unknown_size = false;
    bool _healthy = true;
    unsigned _open_streams = 0;
    unsigned _max_open_streams = 0;
    unsigned _finalized = 0;
    unsigned _aborted = 0;
    unsigned _final_chunks = 0;

    // Every operation goes through here: counts the call, waits while the
    // operation is paused and throws the injected error, if any.
    seastar::future<> enter(replication::operation op, seastar::abort_source* as);
    void commit(const replication::object_identity& id, std::string data, replication::object_metadata md);

public:
    explicit memory_store(replication::store_kind kind = replication::store_kind::memory);

    replication::store_kind kind() const noexcept override { return _kind; }

    seastar::future<std::unique_ptr<replication::source_stream>> open(const replication::object_identity& id, seastar::abort_source* as) override;
    seastar::future<replication::probe_result> exists(const replication::object_identity& id, const replication::object_info& expected, seastar::abort_source* as) override;
    seastar::future<std::unique_ptr<replication::object_writer>> create_writer(const replication::object_identity& id, const replication::object_info& source, seastar::abort_source* as) override;
    seastar::future<> check_health(const seastar::sstring& bucket, seastar::abort_source* as) override;
    seastar::future<> close() override;

    void put(const seastar::sstring& bucket, const seastar::sstring& key, std::string data, replication::object_metadata md = {});
    const stored_object* find(const seastar::sstring& bucket, const seastar::sstring& key) const;
    size_t objects() const noexcept { return _objects.size(); }

    void inject(replication::operation op, replication::error_kind kind, std::optional<unsigned> times = 1, unsigned skip = 0);
    void clear_faults() noexcept;

    // Makes every call of op wait until resume().
    void pause(replication::operation op) noexcept { _paused = op; }
    void resume();
    size_t stalled() const noexcept { return _resume.waiters(); }

    void set_resumable(bool resumable) noexcept { _resumable = resumable; }
    void set_healthy(bool healthy) noexcept { _healthy = healthy; }
    // Streams opened afterwards do not report their size.
    void set_unknown_size(bool unknown) noexcept { _unknown_size = unknown; }

    unsigned calls(replication::operation op) const noexcept { return _calls[static_cast<size_t>(op)]; }
    unsigned open_streams() const noexcept { return _open_streams; }
    unsigned max_open_streams() const noexcept { return _max_open_streams; }
    unsigned finalized_writes() const noexcept { return _finalized; }
    unsigned aborted_writes() const noexcept { return _aborted; }
    // Chunks written with is_final set.
    unsigned final_chunks() const noexcept { return _final_chunks; }
};

// Hex MD5 of data, the fingerprint the memory store reports.
seastar::sstring md5_hex(std::string_view data);

} // namespace tests
