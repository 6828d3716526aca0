#include "hcert/compression.hpp"

#include <algorithm>
#include <cstring>
#include <string>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace hcert {

namespace {

constexpr size_t INFLATE_CHUNK = 16 * 1024;

// Releases the inflate state on every exit path
class InflateStream {
public:
    InflateStream() {
        std::memset(&strm_, 0, sizeof(strm_));
        ok_ = inflateInit(&strm_) == Z_OK;
    }
    ~InflateStream() {
        if (ok_) inflateEnd(&strm_);
    }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &strm_; }
    explicit operator bool() const { return ok_; }

private:
    z_stream strm_;
    bool ok_ = false;
};

std::string zlib_message(const z_stream* strm, int ret) {
    if (strm->msg != nullptr) {
        return strm->msg;
    }
    switch (ret) {
        case Z_DATA_ERROR: return "invalid or incomplete deflate data";
        case Z_MEM_ERROR: return "out of memory";
        case Z_BUF_ERROR: return "truncated stream";
        case Z_NEED_DICT: return "preset dictionary required";
        default: return "zlib error " + std::to_string(ret);
    }
}

} // namespace

bool has_zlib_header(const Bytes& data) {
    if (data.empty()) {
        return false;
    }
    // CMF only; a bad FLG check is left for inflate to reject
    uint8_t cmf = data[0];
    if ((cmf & 0x0F) != Z_DEFLATED) return false;  // compression method 8
    return (cmf >> 4) <= 7;                         // window size up to 32K
}

Result<Bytes> zlib_inflate(const Bytes& data, size_t max_size) {
    InflateStream stream;
    if (!stream) {
        return Result<Bytes>::err(make_error(ErrorCode::DECOMPRESS_ERROR, "inflateInit failed"));
    }

    z_stream* strm = stream.get();
    strm->next_in = const_cast<Bytef*>(data.data());
    strm->avail_in = static_cast<uInt>(data.size());

    Bytes result;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        size_t produced = result.size();
        if (produced >= max_size) {
            // Output is full; the stream may still end without another byte
            uint8_t probe = 0;
            strm->next_out = &probe;
            strm->avail_out = 1;
            ret = inflate(strm, Z_NO_FLUSH);
            if (ret == Z_STREAM_END && strm->avail_out == 1) {
                break;
            }
            return Result<Bytes>::err(make_error(
                ErrorCode::DECOMPRESS_ERROR,
                "inflated size exceeds limit of " + std::to_string(max_size) + " bytes"));
        }
        size_t chunk = std::min(INFLATE_CHUNK, max_size - produced);
        result.resize(produced + chunk);
        strm->next_out = result.data() + produced;
        strm->avail_out = static_cast<uInt>(chunk);

        ret = inflate(strm, Z_NO_FLUSH);
        result.resize(produced + (chunk - strm->avail_out));

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret != Z_OK) {
            return Result<Bytes>::err(
                make_error(ErrorCode::DECOMPRESS_ERROR, zlib_message(strm, ret)));
        }
        if (strm->avail_in == 0 && strm->avail_out != 0) {
            // Input exhausted before the end-of-stream marker and checksum
            return Result<Bytes>::err(
                make_error(ErrorCode::DECOMPRESS_ERROR, "truncated zlib stream"));
        }
    }

    if (strm->avail_in != 0) {
        spdlog::debug("ignoring {} bytes after zlib stream end", strm->avail_in);
    }

    return Result<Bytes>::ok(std::move(result));
}

Result<Bytes> maybe_decompress(const Bytes& data, size_t max_size) {
    if (!has_zlib_header(data)) {
        spdlog::debug("no zlib header, passing {} bytes through", data.size());
        return Result<Bytes>::ok(data);
    }
    return zlib_inflate(data, max_size);
}

Result<Bytes> zlib_deflate(const Bytes& data, int level) {
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    Bytes out(bound);
    int ret = compress2(out.data(), &bound, data.data(), static_cast<uLong>(data.size()), level);
    if (ret != Z_OK) {
        return Result<Bytes>::err(
            make_error(ErrorCode::DECOMPRESS_ERROR, "compress2 failed: " + std::to_string(ret)));
    }
    out.resize(bound);
    return Result<Bytes>::ok(std::move(out));
}

} // namespace hcert
