/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <seastar/testing/thread_test_case.hh>

#include "replication/errors.hh"
#include "replication/orchestrator.hh"
#include "replication/store_registry.hh"
#include "stores/fs_store.hh"
#include "test/lib/log.hh"
#include "test/lib/random_utils.hh"
#include "test/lib/tmpdir.hh"

using namespace seastar;
using namespace replication;

static void write_file(const fs::path& path, std::string_view content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), content.size());
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::string as_string(const temporary_buffer<char>& buf) {
    return std::string(buf.get(), buf.size());
}

static unsigned count_leftovers(const fs::path& dir) {
    unsigned n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().filename().native().find(".partial") != std::string::npos) {
            ++n;
        }
    }
    return n;
}

static error_kind error_of(std::function<void()> f) {
    try {
        f();
    } catch (...) {
        return classify(std::current_exception());
    }
    BOOST_FAIL("expected an exception");
    return error_kind::internal;
}

SEASTAR_THREAD_TEST_CASE(test_fs_source_reads_ranges) {
    tmpdir tmp;
    write_file(tmp.path() / "bucket" / "dir" / "file.txt", "hello world");
    stores::fs_store store(tmp.path());

    auto stream = store.open(object_identity(store_kind::filesystem, "bucket", "/dir/file.txt"), nullptr).get();
    BOOST_REQUIRE(stream->resumable());
    BOOST_REQUIRE_EQUAL(*stream->info().size, 11);
    BOOST_REQUIRE(stream->info().fingerprint);
    BOOST_REQUIRE_EQUAL(as_string(stream->read(0, 5, nullptr).get()), "hello");
    BOOST_REQUIRE_EQUAL(as_string(stream->read(6, 100, nullptr).get()), "world");
    BOOST_REQUIRE(stream->read(11, 5, nullptr).get().empty());
    // Reading again from an earlier offset is allowed.
    BOOST_REQUIRE_EQUAL(as_string(stream->read(0, 11, nullptr).get()), "hello world");
    stream->close().get();
}

SEASTAR_THREAD_TEST_CASE(test_fs_open_errors) {
    tmpdir tmp;
    fs::create_directories(tmp.path() / "bucket" / "dir");
    stores::fs_store store(tmp.path());

    BOOST_REQUIRE(error_of([&] { store.open(object_identity(store_kind::filesystem, "bucket", "missing"), nullptr).get(); }) == error_kind::not_found);
    BOOST_REQUIRE(error_of([&] { store.open(object_identity(store_kind::filesystem, "bucket", "dir"), nullptr).get(); }) == error_kind::invalid_request);
    BOOST_REQUIRE(error_of([&] { store.open(object_identity(store_kind::filesystem, "bucket", "../../etc/passwd"), nullptr).get(); }) == error_kind::invalid_request);
    BOOST_REQUIRE(error_of([&] { store.open(object_identity(store_kind::filesystem, "a/b", "key"), nullptr).get(); }) == error_kind::invalid_request);
}

SEASTAR_THREAD_TEST_CASE(test_fs_writer_commits_on_finalize) {
    tmpdir tmp;
    stores::fs_store store(tmp.path());
    object_identity id(store_kind::filesystem, "bucket", "nested/dir/object.bin");
    auto path = store.path_of(id);
    object_info source{.size = 6, .fingerprint = "fp-1"};

    auto writer = store.create_writer(id, source, nullptr).get();
    writer->write(chunk{0, temporary_buffer<char>("abc", 3), false}, nullptr).get();
    writer->write(chunk{3, temporary_buffer<char>("def", 3), true}, nullptr).get();
    // A replayed chunk is ignored.
    writer->write(chunk{3, temporary_buffer<char>("def", 3), true}, nullptr).get();
    BOOST_REQUIRE(!fs::exists(path));
    BOOST_REQUIRE_EQUAL(count_leftovers(path.parent_path()), 1);

    writer->finalize(nullptr).get();
    BOOST_REQUIRE_EQUAL(read_file(path), "abcdef");
    BOOST_REQUIRE_EQUAL(count_leftovers(path.parent_path()), 0);
    auto md = read_file(stores::fs_store::metadata_path_of(path));
    BOOST_REQUIRE_NE(md.find("source-fingerprint=fp-1\n"), std::string::npos);
    BOOST_REQUIRE_NE(md.find("source-size=6\n"), std::string::npos);

    BOOST_REQUIRE(store.exists(id, source, nullptr).get() == probe_result::present_matching);
    BOOST_REQUIRE(store.exists(id, object_info{.size = 6, .fingerprint = "fp-2"}, nullptr).get() == probe_result::present_differing);
    BOOST_REQUIRE(store.exists(id, object_info{.size = 6}, nullptr).get() == probe_result::present_differing);
    BOOST_REQUIRE(store.exists(object_identity(store_kind::filesystem, "bucket", "other"), source, nullptr).get() == probe_result::absent);
}

SEASTAR_THREAD_TEST_CASE(test_fs_writer_abort_discards_data) {
    tmpdir tmp;
    stores::fs_store store(tmp.path());
    object_identity id(store_kind::filesystem, "bucket", "object");
    auto path = store.path_of(id);

    auto writer = store.create_writer(id, object_info{.size = 3}, nullptr).get();
    writer->write(chunk{0, temporary_buffer<char>("abc", 3), true}, nullptr).get();
    writer->abort().get();
    writer->abort().get();
    BOOST_REQUIRE(!fs::exists(path));
    BOOST_REQUIRE(!fs::exists(stores::fs_store::metadata_path_of(path)));
    BOOST_REQUIRE_EQUAL(count_leftovers(path.parent_path()), 0);
}

SEASTAR_THREAD_TEST_CASE(test_fs_failed_commit_leaves_no_matching_metadata) {
    tmpdir tmp;
    stores::fs_store store(tmp.path());
    object_identity id(store_kind::filesystem, "bucket", "object");
    auto path = store.path_of(id);
    // A non-empty directory in place of the object makes the final rename fail.
    write_file(path / "occupied", "x");
    struct stat st;
    BOOST_REQUIRE_EQUAL(::stat(path.c_str(), &st), 0);
    // Same size as what is in the way, so only the recorded fingerprint
    // could tell them apart.
    auto data = tests::random::get_bytes(st.st_size);
    object_info source{.size = data.size(), .fingerprint = "fp-new"};

    auto writer = store.create_writer(id, source, nullptr).get();
    writer->write(chunk{0, temporary_buffer<char>(data.data(), data.size()), true}, nullptr).get();
    BOOST_REQUIRE(error_of([&] { writer->finalize(nullptr).get(); }) == error_kind::io);
    writer->abort().get();

    BOOST_REQUIRE(!fs::exists(stores::fs_store::metadata_path_of(path)));
    BOOST_REQUIRE_EQUAL(count_leftovers(path.parent_path()), 0);
    BOOST_REQUIRE(store.exists(id, source, nullptr).get() != probe_result::present_matching);
}

SEASTAR_THREAD_TEST_CASE(test_fs_overwrite_replaces_metadata) {
    tmpdir tmp;
    stores::fs_store store(tmp.path());
    object_identity id(store_kind::filesystem, "bucket", "object");
    auto path = store.path_of(id);

    for (auto fp : {"fp-1", "fp-2"}) {
        object_info source{.size = 3, .fingerprint = fp};
        auto writer = store.create_writer(id, source, nullptr).get();
        writer->write(chunk{0, temporary_buffer<char>(fp, 3), true}, nullptr).get();
        writer->finalize(nullptr).get();
    }
    BOOST_REQUIRE_EQUAL(read_file(path), "fp-");
    BOOST_REQUIRE(store.exists(id, object_info{.size = 3, .fingerprint = "fp-2"}, nullptr).get() == probe_result::present_matching);
    BOOST_REQUIRE(store.exists(id, object_info{.size = 3, .fingerprint = "fp-1"}, nullptr).get() == probe_result::present_differing);
    BOOST_REQUIRE_EQUAL(count_leftovers(path.parent_path()), 0);
}

SEASTAR_THREAD_TEST_CASE(test_fs_out_of_order_chunk_is_refused) {
    tmpdir tmp;
    stores::fs_store store(tmp.path());
    auto writer = store.create_writer(object_identity(store_kind::filesystem, "bucket", "object"), object_info{}, nullptr).get();
    BOOST_REQUIRE(error_of([&] { writer->write(chunk{5, temporary_buffer<char>("abc", 3), false}, nullptr).get(); }) == error_kind::invalid_request);
    writer->abort().get();
}

SEASTAR_THREAD_TEST_CASE(test_fs_health) {
    tmpdir tmp;
    fs::create_directories(tmp.path() / "bucket");
    stores::fs_store store(tmp.path());
    store.check_health("bucket", nullptr).get();
    BOOST_REQUIRE(error_of([&] { store.check_health("nope", nullptr).get(); }) == error_kind::not_found);
}

SEASTAR_THREAD_TEST_CASE(test_fs_to_fs_replication_is_idempotent) {
    tmpdir tmp;
    auto data = tests::random::get_bytes(100'000);
    write_file(tmp.path() / "src" / "data" / "blob", data);

    store_registry stores;
    stores.emplace<stores::fs_store>(tmp.path());
    orchestrator orch(orchestrator_config{.chunk_size = 4096}, stores);
    replication_request req{
        .source = object_identity(store_kind::filesystem, "src", "data/blob"),
        .destination = object_identity(store_kind::filesystem, "dst", "data/blob"),
    };

    auto first = orch.replicate(req).get();
    BOOST_REQUIRE(first.status == job_status::succeeded);
    BOOST_REQUIRE_EQUAL(first.bytes_transferred, data.size());
    BOOST_REQUIRE_EQUAL(first.chunks, (data.size() + 4095) / 4096);
    BOOST_REQUIRE(read_file(tmp.path() / "dst" / "data" / "blob") == data);

    auto second = orch.replicate(req).get();
    BOOST_REQUIRE(second.status == job_status::skipped);

    // A changed source is copied again.
    write_file(tmp.path() / "src" / "data" / "blob", "changed");
    auto third = orch.replicate(req).get();
    BOOST_REQUIRE(third.status == job_status::succeeded);
    BOOST_REQUIRE_EQUAL(read_file(tmp.path() / "dst" / "data" / "blob"), "changed");

    orch.stop().get();
    stores.close().get();
}
