#include "hcert/file_io.hpp"
#include "hcert/signature.hpp"

#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hcert {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// "key" holds either a PEM block or base64 DER
std::optional<Bytes> key_material(const std::string& text) {
    if (text.find("-----BEGIN") != std::string::npos) {
        return Bytes(text.begin(), text.end());
    }
    return base64_decode(text);
}

Error config_error(const std::string& message) {
    return make_error(ErrorCode::CONFIG_ERROR, message);
}

} // namespace

void KeyRing::add(const Bytes& kid, PublicKey key) {
    auto it = keys_.find(kid);
    if (it != keys_.end()) {
        it->second = std::move(key);
        return;
    }
    keys_.emplace(kid, std::move(key));
}

const PublicKey* KeyRing::find(const Bytes& kid) const {
    auto it = keys_.find(kid);
    return it == keys_.end() ? nullptr : &it->second;
}

Result<KeyRing> parse_key_ring(const std::string& json_str) {
    KeyRing ring;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            return Result<KeyRing>::err(config_error("key ring JSON must be an object"));
        }
        if (!j.contains("keys") || !j["keys"].is_array()) {
            return Result<KeyRing>::err(config_error("key ring needs a \"keys\" array"));
        }

        size_t index = 0;
        for (const auto& entry : j["keys"]) {
            std::string where = "keys[" + std::to_string(index++) + "]";
            if (!entry.is_object()) {
                spdlog::warn("{}: not an object, skipped", where);
                continue;
            }

            auto kid_text = get_string(entry, "kid");
            auto key_text = get_string(entry, "key");
            if (!kid_text || !key_text) {
                spdlog::warn("{}: needs string \"kid\" and \"key\", skipped", where);
                continue;
            }

            auto kid = base64_decode(*kid_text);
            if (!kid || kid->empty()) {
                spdlog::warn("{}: kid is not valid base64, skipped", where);
                continue;
            }

            auto material = key_material(*key_text);
            if (!material) {
                spdlog::warn("{}: key is neither PEM nor base64 DER, skipped", where);
                continue;
            }

            auto key = load_public_key(*material);
            if (key.isErr()) {
                spdlog::warn("{}: {}, skipped", where, key.error().message());
                continue;
            }

            ring.add(*kid, key.value());
        }
    } catch (const nlohmann::json::parse_error& e) {
        return Result<KeyRing>::err(config_error(std::string("parse error: ") + e.what()));
    } catch (const nlohmann::json::exception& e) {
        return Result<KeyRing>::err(config_error(std::string("JSON error: ") + e.what()));
    }

    spdlog::debug("key ring holds {} keys", ring.size());
    return Result<KeyRing>::ok(std::move(ring));
}

Result<KeyRing> load_key_ring(const std::string& path) {
    auto content = fs::read_file(path);
    if (!content) {
        return Result<KeyRing>::err(config_error("cannot read key ring: " + path));
    }
    auto ring = parse_key_ring(*content);
    if (ring.isErr()) {
        ring.error().withContext(path);
    }
    return ring;
}

} // namespace hcert
