#include "relay_cpp/response_parser.hpp"

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/error.hpp>

namespace relay_cpp {

    namespace http = boost::beast::http;

    ResponseParser::ResponseParser(Options opts) : opts_(opts) {
        reset_parser();
    }

    void ResponseParser::reset_parser() {
        parser_.emplace();
        parser_->eager(true);
        parser_->header_limit(64 * 1024);
        if (opts_.max_body_bytes == 0) {
            parser_->body_limit(boost::none);
        } else {
            parser_->body_limit(opts_.max_body_bytes);
        }
        if (opts_.head_request) parser_->skip(true);
        headers_seen_ = false;
    }

    void ResponseParser::reset() {
        pending_.consume(pending_.size());
        decoded_.clear();
        decoding_ = false;
        error_.reset();
        reset_parser();
    }

    size_t ResponseParser::feed(std::string_view data) {
        if (error_) return 0;
        if (is_message_complete()) return 0;

        auto mb = pending_.prepare(data.size());
        boost::asio::buffer_copy(mb, boost::asio::buffer(data.data(), data.size()));
        pending_.commit(data.size());

        while (pending_.size() > 0) {
            boost::beast::error_code ec;
            size_t used = parser_->put(pending_.data(), ec);
            pending_.consume(used);

            if (ec == http::error::need_more) break;
            if (ec) {
                error_ = ec.message();
                break;
            }
            if (!headers_seen_ && parser_->is_header_done()) {
                headers_seen_ = true;
                int status = static_cast<int>(parser_->get().result_int());
                if (status >= 100 && status < 200 && status != 101) {
                    // Interim response: parse the final one from what follows
                    reset_parser();
                    continue;
                }
                on_headers();
            }
            drain_body();
            if (error_) break;
            if (parser_->is_done()) break;
            if (used == 0) break;
        }

        if (error_ || (is_message_complete() && pending_.size() > 0)) {
            size_t rejected = std::min(pending_.size(), data.size());
            pending_.consume(pending_.size());
            return data.size() - rejected;
        }
        return data.size();
    }

    void ResponseParser::put_eof() {
        if (error_ || !parser_ || parser_->is_done()) return;
        boost::beast::error_code ec;
        parser_->put_eof(ec);
        if (ec) {
            error_ = ec.message();
            return;
        }
        drain_body();
    }

    void ResponseParser::on_headers() {
        if (!opts_.decompress || opts_.head_request) return;
        auto enc = parser_->get()[http::field::content_encoding];
        if (boost::beast::iequals(enc, "gzip") ||
            boost::beast::iequals(enc, "x-gzip") ||
            boost::beast::iequals(enc, "deflate")) {
            if (!decoder_.begin()) {
                error_ = decoder_.last_error();
                return;
            }
            decoding_ = true;
        }
    }

    void ResponseParser::drain_body() {
        if (!parser_->is_header_done()) return;
        auto& body = parser_->get().body();
        if (body.empty()) return;
        if (decoding_) {
            if (decoder_.write(body, decoded_) == GzipDecoder::Status::Error) {
                error_ = "content decoding failed: " + decoder_.last_error();
            }
        } else {
            decoded_.append(body);
        }
        body.clear();
    }

    bool ResponseParser::is_headers_complete() const noexcept {
        return headers_seen_ && parser_->is_header_done();
    }

    bool ResponseParser::is_message_complete() const noexcept {
        return is_headers_complete() && parser_->is_done();
    }

    bool ResponseParser::needs_eof() const noexcept {
        return is_headers_complete() && parser_->need_eof();
    }

    int ResponseParser::status_code() const noexcept {
        if (!is_headers_complete()) return 0;
        return static_cast<int>(parser_->get().result_int());
    }

    std::string ResponseParser::reason() const {
        if (!is_headers_complete()) return {};
        return std::string(parser_->get().reason());
    }

    unsigned ResponseParser::version() const noexcept {
        if (!is_headers_complete()) return 0;
        return parser_->get().version();
    }

    const Headers& ResponseParser::headers() const {
        if (!is_headers_complete()) return empty_;
        return parser_->get().base();
    }

    std::string ResponseParser::recv_body() {
        std::string out;
        out.swap(decoded_);
        return out;
    }

}  // namespace relay_cpp
