/**
 * hcert CLI - verify command
 *
 * Check the COSE signature of a token against a key or a key ring.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <hcert/signature.hpp>

namespace hcert::cli::commands {

namespace {

struct VerifyOptions {
    std::string key_file;    // --key
    std::string key_ring;    // --keys
};

int cmd_verify(const GlobalOptions& opts, const InputOptions& in, const VerifyOptions& verify_opts) {
    init_logging(opts);

    if (verify_opts.key_file.empty() == verify_opts.key_ring.empty()) {
        print_error("give exactly one of --key or --keys", opts.json);
        return EXIT_USAGE;
    }

    auto token = read_token(in, opts);
    if (!token) {
        return EXIT_USAGE;
    }

    auto decoded = decode_certificate(*token);
    if (decoded.isErr()) {
        print_error(decoded.error(), opts.json);
        return EXIT_FAILURE_RESULT;
    }
    const Envelope& env = decoded.value().envelope;
    auto kid = env.key_id();

    std::optional<PublicKey> key;
    if (!verify_opts.key_file.empty()) {
        auto loaded = load_public_key_file(verify_opts.key_file);
        if (loaded.isErr()) {
            print_error(loaded.error(), opts.json);
            return EXIT_USAGE;
        }
        key = loaded.value();
    } else {
        auto ring = load_key_ring(verify_opts.key_ring);
        if (ring.isErr()) {
            print_error(ring.error(), opts.json);
            return EXIT_USAGE;
        }
        if (!kid) {
            print_error(make_error(ErrorCode::KEY_ERROR, "envelope carries no kid"), opts.json);
            return EXIT_FAILURE_RESULT;
        }
        const PublicKey* found = ring.value().find(*kid);
        if (!found) {
            print_error(make_error(ErrorCode::KEY_ERROR, "no key for kid " + bytes_to_hex(*kid)), opts.json);
            return EXIT_FAILURE_RESULT;
        }
        key = *found;
    }

    auto status = verify_envelope(env, *key);
    if (status.isErr()) {
        print_error(status.error(), opts.json);
        return EXIT_FAILURE_RESULT;
    }

    bool verified = status.value() == VerificationStatus::Verified;
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["status"] = verification_status_to_string(status.value());
        j["algorithm"] = cose_algorithm_to_string(env.protected_header.algorithm());
        j["kid"] = kid ? nlohmann::json(bytes_to_hex(*kid)) : nlohmann::json(nullptr);
        output_json(j);
    } else {
        std::cout << "Signature " << verification_status_to_string(status.value()) << " ("
                  << cose_algorithm_to_string(env.protected_header.algorithm()) << ", "
                  << key->type() << " key)" << std::endl;
    }
    return verified ? EXIT_OK : EXIT_FAILURE_RESULT;
}

} // namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static InputOptions in;
    static VerifyOptions verify_opts;

    add_input_options(app, in);
    app->add_option("--key", verify_opts.key_file, "PEM or DER public key or certificate");
    app->add_option("--keys", verify_opts.key_ring, "Key ring JSON, key chosen by kid");

    app->callback([&opts]() { std::exit(cmd_verify(opts, in, verify_opts)); });
}

} // namespace hcert::cli::commands
