#pragma once

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "gzip_decoder.hpp"
#include "headers.hpp"

namespace relay_cpp {

    /**
     * @brief Incremental HTTP/1.x response parser.
     *
     * Bytes go in through feed(). Headers become available once
     * is_headers_complete() is true, and decoded body bytes accumulate until
     * recv_body() flushes them. Interim 1xx responses (except 101) are
     * skipped.
     */
    class ResponseParser {
       public:
        struct Options {
            /// The request was HEAD: no body follows the headers.
            bool head_request{false};
            /// Inflate gzip/deflate Content-Encodings.
            bool decompress{true};
            /// 0 means no limit.
            size_t max_body_bytes{0};
        };

        ResponseParser() : ResponseParser(Options{}) {}
        explicit ResponseParser(Options opts);

        /// @brief Forget everything parsed so far, keeping the options.
        void reset();

        /// @brief Feed bytes read from the connection.
        /// @return Number of bytes accepted. Fewer than data.size() means the
        /// bytes were invalid or arrived after the message completed.
        size_t feed(std::string_view data);

        /// @brief The peer closed the connection. Completes a message that is
        /// delimited by connection close.
        void put_eof();

        bool is_headers_complete() const noexcept;
        bool is_message_complete() const noexcept;
        /// @brief The message length is delimited by EOF.
        bool needs_eof() const noexcept;

        int status_code() const noexcept;
        std::string reason() const;
        unsigned version() const noexcept;

        /// @brief Response headers as received.
        const Headers& headers() const;

        /// @brief Return and clear the decoded body bytes received so far.
        std::string recv_body();

        /// @brief True when the body is being decompressed.
        bool is_decoding() const noexcept { return decoding_; }

        /// @brief Parse error, if any. Sticky.
        const std::optional<std::string>& error() const noexcept {
            return error_;
        }

       private:
        using parser_type = boost::beast::http::response_parser<
            boost::beast::http::string_body>;

        void reset_parser();
        void on_headers();
        void drain_body();

        Options opts_;
        std::optional<parser_type> parser_;
        boost::beast::flat_buffer pending_;
        std::string decoded_;
        GzipDecoder decoder_;
        bool decoding_{false};
        bool headers_seen_{false};
        std::optional<std::string> error_;
        Headers empty_;
    };

}  // namespace relay_cpp
