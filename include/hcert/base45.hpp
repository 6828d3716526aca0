#pragma once

#include "hcert/result.hpp"
#include "hcert/types.hpp"

#include <string>

namespace hcert {

// Base45 alphabet (RFC 9285)
constexpr const char* BASE45_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ $%*+-./:";

// Decode base45 text. Three characters yield two bytes, a trailing pair
// yields one. Fails with DECODE_ERROR on characters outside the alphabet,
// groups whose value overflows, or a single dangling character.
Result<Bytes> base45_decode(const std::string& text);

std::string base45_encode(const Bytes& data);

} // namespace hcert
