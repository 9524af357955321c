#pragma once

#include <zlib.h>

#include <string>
#include <string_view>

namespace relay_cpp {

    /// @brief Streaming inflater for gzip and deflate Content-Encodings.
    /// Accepts gzip, zlib-wrapped deflate and raw deflate.
    class GzipDecoder {
       public:
        enum class Status { Ok, Done, Error };

        GzipDecoder() = default;
        ~GzipDecoder();

        GzipDecoder(const GzipDecoder&) = delete;
        GzipDecoder& operator=(const GzipDecoder&) = delete;

        /// @brief Prepare for a new stream. Returns false when zlib could not
        /// be initialised.
        bool begin();

        /// @brief Inflate input, appending the output to out.
        Status write(std::string_view input, std::string& out);

        bool is_done() const noexcept { return done_; }
        const std::string& last_error() const noexcept { return error_; }

       private:
        void end();
        bool restart_raw();

        z_stream strm_{};
        bool initialised_{false};
        bool done_{false};
        bool tried_raw_{false};
        size_t total_in_{0};
        std::string error_;
    };

}  // namespace relay_cpp
