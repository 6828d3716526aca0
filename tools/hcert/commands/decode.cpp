/**
 * hcert CLI - decode command
 *
 * Decode a token and print the certificate report.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <hcert/report.hpp>

namespace hcert::cli::commands {

namespace {

int cmd_decode(const GlobalOptions& opts, const InputOptions& in) {
    init_logging(opts);

    auto token = read_token(in, opts);
    if (!token) {
        return EXIT_USAGE;
    }

    auto value_sets = resolve_value_sets(in);
    if (value_sets.isErr()) {
        print_error(value_sets.error(), opts.json);
        return EXIT_USAGE;
    }

    auto decoded = decode_certificate(*token);
    if (decoded.isErr()) {
        print_error(decoded.error(), opts.json);
        return EXIT_FAILURE_RESULT;
    }

    const auto& record = decoded.value().record;
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["certificate"] = to_json(record, value_sets.value());
        output_json(j);
    } else {
        std::cout << render_text(record, value_sets.value());
    }

    for (const auto& issue : record.issues) {
        spdlog::warn("{} at {}: {}", error_code_to_string(issue.code), issue.path, issue.reason);
    }
    return EXIT_OK;
}

} // namespace

void setup_decode(CLI::App* app, GlobalOptions& opts) {
    static InputOptions in;

    add_input_options(app, in);
    app->add_option("--value-sets", in.value_sets, "JSON file extending the code tables");

    app->callback([&opts]() { std::exit(cmd_decode(opts, in)); });
}

} // namespace hcert::cli::commands
