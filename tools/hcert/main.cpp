/**
 * hcert CLI - Entry Point
 *
 * Decode and inspect EU Digital Covid Certificate (HC1) tokens.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace hcert::cli::commands {
    void setup_decode(CLI::App* app, GlobalOptions& opts);
    void setup_inspect(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace hcert::cli;

    CLI::App app{"hcert - EU Digital Covid Certificate decoder"};
    app.set_version_flag("-V,--version", HCERT_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging on stderr");
    app.add_flag("-q,--quiet", opts.quiet, "No logging");

    // Commands
    auto* decode_cmd = app.add_subcommand("decode", "Decode a token and print the certificate");
    commands::setup_decode(decode_cmd, opts);

    auto* inspect_cmd = app.add_subcommand("inspect", "Show the COSE envelope and raw CBOR");
    commands::setup_inspect(inspect_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check the signature against a public key");
    commands::setup_verify(verify_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e);
        return rc == 0 ? EXIT_OK : EXIT_USAGE;
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return EXIT_OK;
}
