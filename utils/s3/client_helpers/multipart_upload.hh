/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include "utils/s3/client.hh"

namespace s3 {

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
inline constexpr size_t aws_minimum_part_size = 5 << 20;
// "Part numbers can be any number from 1 to 10,000, inclusive."
inline constexpr unsigned aws_maximum_parts = 10'000;

// One multipart upload of an object. Parts are numbered from 1 and may be
// uploaded again under the same number, the last upload of a number wins.
class multipart_upload {
protected:
    seastar::shared_ptr<client> _client;
    seastar::sstring _object_name;
    object_metadata _metadata;
    seastar::sstring _upload_id;
    std::vector<seastar::sstring> _part_etags;

public:
    multipart_upload(seastar::shared_ptr<client> cln, seastar::sstring object_name, object_metadata metadata);

    bool upload_started() const noexcept;
    unsigned parts_uploaded() const noexcept;

    seastar::future<> start_upload(seastar::abort_source* as);
    seastar::future<> upload_part(unsigned part_number, body_buffers bufs, seastar::abort_source* as);
    seastar::future<> finalize_upload(seastar::abort_source* as);
    seastar::future<> abort_upload();
};

} // namespace s3
