/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif
#include <initializer_list>
#include <string_view>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

namespace s3 {

struct range {
    uint64_t off;
    size_t len;
};

// Builds the request path of an object, /bucket/key, with the key URI-encoded
// the way SigV4 expects the canonical URI.
seastar::sstring make_object_name(std::string_view bucket, std::string_view key);

seastar::sstring parse_multipart_upload_id(seastar::sstring& body);
unsigned prepare_multipart_upload_parts(const std::vector<seastar::sstring>& etags);
seastar::future<> dump_multipart_upload_parts(seastar::output_stream<char> out, const std::vector<seastar::sstring>& etags);
rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names);

} // namespace s3
