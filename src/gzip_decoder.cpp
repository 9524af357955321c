#include "relay_cpp/gzip_decoder.hpp"

namespace relay_cpp {

    GzipDecoder::~GzipDecoder() { end(); }

    void GzipDecoder::end() {
        if (initialised_) {
            inflateEnd(&strm_);
            initialised_ = false;
        }
    }

    bool GzipDecoder::begin() {
        end();
        strm_ = z_stream{};
        done_ = false;
        tried_raw_ = false;
        total_in_ = 0;
        error_.clear();
        // 15 + 32: auto-detect gzip or zlib header
        if (inflateInit2(&strm_, 15 + 32) != Z_OK) {
            error_ = "inflateInit2 failed";
            return false;
        }
        initialised_ = true;
        return true;
    }

    bool GzipDecoder::restart_raw() {
        end();
        strm_ = z_stream{};
        if (inflateInit2(&strm_, -15) != Z_OK) {
            error_ = "inflateInit2 (raw) failed";
            return false;
        }
        initialised_ = true;
        tried_raw_ = true;
        return true;
    }

    GzipDecoder::Status GzipDecoder::write(std::string_view input,
                                           std::string& out) {
        if (!initialised_) {
            error_ = "decoder not initialised";
            return Status::Error;
        }
        if (done_) return input.empty() ? Status::Done : Status::Error;

        strm_.next_in =
            reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        strm_.avail_in = static_cast<uInt>(input.size());

        char chunk[16384];
        while (strm_.avail_in > 0 || strm_.avail_out == 0) {
            strm_.next_out = reinterpret_cast<Bytef*>(chunk);
            strm_.avail_out = sizeof(chunk);

            int rc = inflate(&strm_, Z_NO_FLUSH);
            out.append(chunk, sizeof(chunk) - strm_.avail_out);

            if (rc == Z_STREAM_END) {
                done_ = true;
                return Status::Done;
            }
            if (rc == Z_DATA_ERROR && !tried_raw_ && total_in_ == 0 &&
                strm_.total_out == 0) {
                // Some servers send raw deflate under "deflate"
                if (!restart_raw()) return Status::Error;
                strm_.next_in =
                    reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
                strm_.avail_in = static_cast<uInt>(input.size());
                continue;
            }
            if (rc == Z_BUF_ERROR) break;
            if (rc != Z_OK) {
                error_ = strm_.msg ? strm_.msg : "inflate failed";
                return Status::Error;
            }
        }
        total_in_ += input.size();
        return Status::Ok;
    }

}  // namespace relay_cpp
