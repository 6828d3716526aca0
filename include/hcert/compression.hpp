#pragma once

#include "hcert/result.hpp"
#include "hcert/types.hpp"

#include <cstddef>

namespace hcert {

constexpr size_t DEFAULT_MAX_INFLATED_SIZE = 1024 * 1024; // 1 MiB

// True when the first byte is a zlib CMF (deflate method, window size
// <= 32K). The FLG check bits are verified by zlib_inflate.
bool has_zlib_header(const Bytes& data);

// Inflate a zlib stream (RFC 1950). Adler-32 trailer is verified by zlib.
// Fails with DECOMPRESS_ERROR on a corrupt or truncated stream, or when
// the output would exceed max_size.
Result<Bytes> zlib_inflate(const Bytes& data, size_t max_size = DEFAULT_MAX_INFLATED_SIZE);

// Inflate when a zlib header is present, otherwise pass data through.
Result<Bytes> maybe_decompress(const Bytes& data, size_t max_size = DEFAULT_MAX_INFLATED_SIZE);

// Deflate into a zlib stream (used to build fixtures).
Result<Bytes> zlib_deflate(const Bytes& data, int level = 9);

} // namespace hcert
