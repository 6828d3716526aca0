#include "hcert/prefix.hpp"

#include <cctype>

namespace hcert {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

Result<PrefixInfo> strip_prefix(const std::string& raw_token) {
    std::string token = trim(raw_token);

    // "HC" + version digit + ':'
    if (token.size() < 4) {
        return Result<PrefixInfo>::err(
            make_error(ErrorCode::FORMAT_ERROR, "token too short for HC1: prefix"));
    }
    if (token.compare(0, 2, HCERT_SCHEME) != 0) {
        return Result<PrefixInfo>::err(
            make_error(ErrorCode::FORMAT_ERROR, "missing HC scheme marker"));
    }
    if (!std::isdigit(static_cast<unsigned char>(token[2])) || token[3] != ':') {
        return Result<PrefixInfo>::err(
            make_error(ErrorCode::FORMAT_ERROR, "malformed scheme marker '" + token.substr(0, 4) + "'"));
    }
    int version = token[2] - '0';
    if (version != HCERT_SUPPORTED_VERSION) {
        return Result<PrefixInfo>::err(make_error(
            ErrorCode::FORMAT_ERROR, "unsupported context version HC" + std::to_string(version)));
    }

    PrefixInfo info;
    info.scheme = HCERT_SCHEME;
    info.version = version;
    info.body = token.substr(4);
    return Result<PrefixInfo>::ok(std::move(info));
}

} // namespace hcert
