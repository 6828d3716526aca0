/**
 * hcert CLI - inspect command
 *
 * Show the envelope metadata and the raw CBOR of a token.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace hcert::cli::commands {

namespace {

std::string kid_hex(const Envelope& envelope) {
    auto kid = envelope.key_id();
    return kid ? bytes_to_hex(*kid) : std::string("<none>");
}

int cmd_inspect(const GlobalOptions& opts, const InputOptions& in) {
    init_logging(opts);

    auto token = read_token(in, opts);
    if (!token) {
        return EXIT_USAGE;
    }

    auto decoded = decode_certificate(*token);
    if (decoded.isErr()) {
        print_error(decoded.error(), opts.json);
        return EXIT_FAILURE_RESULT;
    }

    const auto& d = decoded.value();
    const auto& env = d.envelope;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["prefix"] = d.prefix.scheme + std::to_string(d.prefix.version);
        j["compressed"] = d.compressed;
        j["tagged"] = env.tagged;
        j["algorithm"] = cose_algorithm_to_string(env.protected_header.algorithm());
        j["kid"] = kid_hex(env);
        j["protected_header"] = to_diagnostic(env.protected_header.map);
        j["unprotected_header"] = to_diagnostic(env.unprotected_header);
        j["payload"] = to_diagnostic(d.payload);
        j["signature"] = bytes_to_hex(env.signature);
        output_json(j);
        return EXIT_OK;
    }

    std::cout << "Prefix:\t\t" << d.prefix.scheme << d.prefix.version << std::endl;
    std::cout << "Compressed:\t" << (d.compressed ? "yes" : "no") << std::endl;
    std::cout << "COSE tag 18:\t" << (env.tagged ? "yes" : "no") << std::endl;
    std::cout << "Algorithm:\t" << cose_algorithm_to_string(env.protected_header.algorithm()) << std::endl;
    std::cout << "Key ID:\t\t" << kid_hex(env) << std::endl;
    std::cout << "Signature:\t" << env.signature.size() << " bytes" << std::endl;
    std::cout << std::endl;
    std::cout << "# Protected Header" << std::endl;
    std::cout << to_diagnostic(env.protected_header.map) << std::endl;
    std::cout << "# Unprotected Header" << std::endl;
    std::cout << to_diagnostic(env.unprotected_header) << std::endl;
    std::cout << "# Payload" << std::endl;
    std::cout << to_diagnostic(d.payload) << std::endl;
    return EXIT_OK;
}

} // namespace

void setup_inspect(CLI::App* app, GlobalOptions& opts) {
    static InputOptions in;

    add_input_options(app, in);

    app->callback([&opts]() { std::exit(cmd_inspect(opts, in)); });
}

} // namespace hcert::cli::commands
