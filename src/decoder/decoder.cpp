#include "hcert/decoder.hpp"
#include "hcert/base45.hpp"
#include "hcert/cbor.hpp"

#include <spdlog/spdlog.h>

namespace hcert {

const char* const SAMPLE_TOKEN =
    "HC1:NCFE70X90T9WTWGVLKX49LDA:4NX35 CPX*42BB3XK2F3U7PF9I2F3Z:N3 Q6JC X8Y50.FK6ZK7:EDOLFVC*70B$D% D3IA4W5646946846.966KCN9E%961A6DL6FA7D46XJCCWENF6OF63W5NW6C46WJCT3E$B9WJC0FDTA6AIA%G7X+AQB9746QG7$X8SW6/TC4VCHA7LB7$471S6N-COA7X577:6 47F-CZIC6UCF%6AK4.JCP9EJY8L/5M/5546.96VF6%JCJQEK69WY8KQEPD09WEQDD+Q6TW6FA7C46TPCBEC8ZKW.C8WE7H801AY09ZJC2/D*H8Y3EN3DMPCG/DOUCNB8WY8I3DOUCCECZ CO/EZKEZ964461S6GVC*JC1A6$473W59%6D4627BPFL .4/FQQRJ/2519D+9D831UT8D4KB82JP63-G$C4/1B2SMHXDW2V:CSU6NJIO4U0-T6573C+DM-FARF9.3KMF+PVCBD$%K-4PKOE";

Result<DecodedCertificate> decode_certificate(const std::string& token, const DecodeOptions& options) {
    DecodedCertificate decoded;

    auto prefix = strip_prefix(token);
    if (prefix.isErr()) {
        return Result<DecodedCertificate>::err(prefix.error());
    }
    decoded.prefix = std::move(prefix.value());
    spdlog::debug("prefix {}{}: {} base45 characters", decoded.prefix.scheme,
                  decoded.prefix.version, decoded.prefix.body.size());

    auto raw = base45_decode(decoded.prefix.body);
    if (raw.isErr()) {
        return Result<DecodedCertificate>::err(raw.error());
    }
    spdlog::debug("base45 decoded {} bytes", raw.value().size());

    decoded.compressed = has_zlib_header(raw.value());
    auto inflated = maybe_decompress(raw.value(), options.max_inflated_size);
    if (inflated.isErr()) {
        return Result<DecodedCertificate>::err(inflated.error());
    }
    if (decoded.compressed) {
        spdlog::debug("inflated {} -> {} bytes", raw.value().size(), inflated.value().size());
    }

    auto envelope = parse_envelope(inflated.value());
    if (envelope.isErr()) {
        return Result<DecodedCertificate>::err(envelope.error());
    }
    decoded.envelope = std::move(envelope.value());

    auto payload = decode_cbor(decoded.envelope.payload);
    if (payload.isErr()) {
        return Result<DecodedCertificate>::err(payload.error().withContext("payload"));
    }
    decoded.payload = std::move(payload.value());

    decoded.record = map_certificate(decoded.payload);
    return Result<DecodedCertificate>::ok(std::move(decoded));
}

} // namespace hcert
