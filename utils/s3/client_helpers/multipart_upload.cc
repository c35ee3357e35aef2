/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>

#include "multipart_upload.hh"
#include "utils/log.hh"
#include "utils/s3/aws_error.hh"

using namespace seastar;

namespace s3 {

static logging::logger s3l("s3");

multipart_upload::multipart_upload(shared_ptr<client> cln, sstring object_name, object_metadata metadata)
    : _client(std::move(cln)), _object_name(std::move(object_name)), _metadata(std::move(metadata)) {
}

bool multipart_upload::upload_started() const noexcept {
    return !_upload_id.empty();
}

unsigned multipart_upload::parts_uploaded() const noexcept {
    return _part_etags.size();
}

future<> multipart_upload::start_upload(abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_CreateMultipartUpload.html
    s3l.trace("POST uploads {}", _object_name);
    auto req = http::request::make("POST", _client->_host, _object_name);
    req.query_parameters["uploads"] = "";
    for (const auto& [key, value] : _metadata) {
        req._headers[seastar::format("x-amz-meta-{}", key)] = value;
    }
    co_await _client->make_request(std::move(req), [this] (const http::reply& reply, input_stream<char>&& in) -> future<> {
        auto input = std::move(in);
        auto body = co_await util::read_entire_stream_contiguous(input);
        _upload_id = parse_multipart_upload_id(body);
        if (_upload_id.empty()) {
            co_await coroutine::return_exception(aws::aws_exception(aws::aws_error(aws::aws_error_type::UNKNOWN, "cannot initiate multipart upload", aws::retryable::yes)));
        }
        s3l.trace("created uploads for {} -> id = {}", _object_name, _upload_id);
    }, http::reply::status_type::ok, as);
    _part_etags.clear();
}

future<> multipart_upload::upload_part(unsigned part_number, body_buffers bufs, abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
    if (part_number == 0 || part_number > aws_maximum_parts) {
        throw std::invalid_argument(fmt::format("part number {} is out of range", part_number));
    }
    if (_part_etags.size() < part_number) {
        _part_etags.resize(part_number);
    }
    auto size = body_size(bufs);
    s3l.trace("PUT part {} {} bytes in {} buffers (upload id {})", part_number, size, bufs.size(), _upload_id);
    auto req = http::request::make("PUT", _client->_host, _object_name);
    req.query_parameters.emplace("partNumber", to_sstring(part_number));
    req.query_parameters.emplace("uploadId", _upload_id);
    req.write_body("bin", size, [bufs = std::move(bufs)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            for (const auto& buf : bufs) {
                co_await out.write(buf.get(), buf.size());
            }
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });

    co_await _client->make_request(std::move(req), [this, part_number, size, start = s3_clock::now()] (const http::reply& reply, input_stream<char>&& in) mutable -> future<> {
        auto etag = reply.get_header("ETag");
        if (etag.empty()) {
            co_await coroutine::return_exception(aws::aws_exception(aws::aws_error(aws::aws_error_type::UNKNOWN, "no ETag in part upload reply", aws::retryable::yes)));
        }
        s3l.trace("uploaded {} part data -> etag = {} (upload id {})", part_number, etag, _upload_id);
        _part_etags[part_number - 1] = std::move(etag);
        _client->_write_stats.update(size, s3_clock::now() - start);
        co_await ignore_reply(reply, std::move(in));
    }, http::reply::status_type::ok, as);
}

future<> multipart_upload::finalize_upload(abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_CompleteMultipartUpload.html
    s3l.trace("wait for {} parts to complete (upload id {})", _part_etags.size(), _upload_id);
    unsigned parts_xml_len = prepare_multipart_upload_parts(_part_etags);
    if (parts_xml_len == 0) {
        throw aws::aws_exception(aws::aws_error(aws::aws_error_type::INVALID_PART, "some parts of the upload are missing", aws::retryable::no));
    }

    s3l.trace("POST upload completion {} parts (upload id {})", _part_etags.size(), _upload_id);
    auto req = http::request::make("POST", _client->_host, _object_name);
    req.query_parameters.emplace("uploadId", _upload_id);
    req.write_body("xml", parts_xml_len, [this] (output_stream<char>&& out) -> future<> {
        return dump_multipart_upload_parts(std::move(out), _part_etags);
    });
    // The completion request can be answered with 200 OK and still fail, the
    // error then comes in the body.
    co_await _client->make_request(std::move(req), [] (const http::reply& reply, input_stream<char>&& in) -> future<> {
        auto input = std::move(in);
        auto body = co_await util::read_entire_stream_contiguous(input);
        if (auto error = aws::aws_error::parse(std::move(body))) {
            co_await coroutine::return_exception(aws::aws_exception(std::move(*error)));
        }
    }, http::reply::status_type::ok, as);
    s3l.trace("completed upload of {} (upload id {})", _object_name, _upload_id);
    _upload_id = {};
    _part_etags.clear();
}

future<> multipart_upload::abort_upload() {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_AbortMultipartUpload.html
    s3l.trace("DELETE upload {}", _upload_id);
    auto req = http::request::make("DELETE", _client->_host, _object_name);
    req.query_parameters["uploadId"] = std::exchange(_upload_id, "");
    _part_etags.clear();
    co_await _client->make_request(std::move(req), ignore_reply, http::reply::status_type::no_content);
}

} // namespace s3
