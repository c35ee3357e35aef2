/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <memory>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "client_utils.hh"
#include "utils/assert.hh"
#include "utils/log.hh"

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";

static constexpr std::string_view multipart_upload_complete_entry = "<Part><ETag>{}</ETag><PartNumber>{}</PartNumber></Part>";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace s3 {

using namespace seastar;
static logging::logger s3l("s3");

static bool is_unreserved(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
}

sstring make_object_name(std::string_view bucket, std::string_view key) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string ret;
    ret.reserve(bucket.size() + key.size() + 2);
    ret.push_back('/');
    ret.append(bucket);
    ret.push_back('/');
    for (unsigned char c : key) {
        if (is_unreserved(c) || c == '/') {
            ret.push_back(c);
        } else {
            ret.push_back('%');
            ret.push_back(digits[c >> 4]);
            ret.push_back(digits[c & 0xf]);
        }
    }
    return sstring(ret.data(), ret.size());
}

sstring parse_multipart_upload_id(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse initiate multipart upload response: {}", e.what());
        // The caller is supposed to check the upload-id to be empty
        // and handle the error the way it prefers
        return "";
    }
    auto root_node = doc->first_node("InitiateMultipartUploadResult");
    auto uploadid_node = root_node ? root_node->first_node("UploadId") : nullptr;
    if (!uploadid_node) {
        s3l.warn("no upload id in initiate multipart upload response");
        return "";
    }
    return uploadid_node->value();
}

unsigned prepare_multipart_upload_parts(const std::vector<sstring>& etags) {
    unsigned ret = multipart_upload_complete_header.size();

    unsigned nr = 1;
    for (auto& etag : etags) {
        if (etag.empty()) {
            // 0 here means some part failed to upload.
            // Caller checks it an aborts the multipart upload altogether
            return 0;
        }
        // length of the format string - four braces + length of the etag + length of the number
        ret += multipart_upload_complete_entry.size() - 4 + etag.size() + fmt::formatted_size("{}", nr);
        nr++;
    }
    ret += multipart_upload_complete_trailer.size();
    return ret;
}

future<> dump_multipart_upload_parts(output_stream<char> out, const std::vector<sstring>& etags) {
    std::exception_ptr ex;
    try {
        co_await out.write(multipart_upload_complete_header.data(), multipart_upload_complete_header.size());

        unsigned nr = 1;
        for (auto& etag : etags) {
            OBJREPL_ASSERT(!etag.empty());
            auto entry = fmt::format(fmt::runtime(multipart_upload_complete_entry), etag, nr);
            co_await out.write(entry.data(), entry.size());
            nr++;
        }
        co_await out.write(multipart_upload_complete_trailer.data(), multipart_upload_complete_trailer.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root,
                                           std::initializer_list<std::string_view> names) {
    OBJREPL_ASSERT(root);
    auto* node = root;
    for (auto name : names) {
        node = node->first_node(name.data(), name.size());
        if (!node) {
            throw std::runtime_error(fmt::format("'{}' is not found", name));
        }
    }
    return node;
}

} // namespace s3
