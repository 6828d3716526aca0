/**
 * hcert CLI - Common utilities and types
 */

#pragma once

#include <hcert/decoder.hpp>
#include <hcert/file_io.hpp>
#include <hcert/value_sets.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace hcert::cli {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RESULT = 1;  // decode failure or unverified signature
constexpr int EXIT_USAGE = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Where the token comes from. Exactly one of token, file or --test.
 */
struct InputOptions {
    std::string token;             // positional
    std::string file;              // -f, --file ("-" for stdin)
    bool test = false;             // --test
    std::string value_sets;        // --value-sets
};

/**
 * Route spdlog to stderr and pick the level from -v / -q.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("hcert");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%l] %v");
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::off);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    print_error(error.toString(), json_mode);
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Resolve the token text from the input options.
 * Returns std::nullopt (after printing the reason) on a usage problem.
 */
inline std::optional<std::string> read_token(const InputOptions& in, const GlobalOptions& opts) {
    int sources = (in.token.empty() ? 0 : 1) + (in.file.empty() ? 0 : 1) + (in.test ? 1 : 0);
    if (sources != 1) {
        print_error("give exactly one of TOKEN, --file or --test", opts.json);
        return std::nullopt;
    }

    if (in.test) {
        return std::string(SAMPLE_TOKEN);
    }
    if (!in.token.empty()) {
        return in.token;
    }
    if (in.file == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto content = fs::read_file(in.file);
    if (!content) {
        print_error("cannot read " + in.file, opts.json);
        return std::nullopt;
    }
    return content;
}

/**
 * Built-in value sets, extended by --value-sets when given.
 */
inline Result<ValueSets> resolve_value_sets(const InputOptions& in) {
    if (in.value_sets.empty()) {
        return Result<ValueSets>::ok(builtin_value_sets());
    }
    return load_value_sets(in.value_sets, builtin_value_sets());
}

/**
 * Register the shared input options on a subcommand.
 */
template<typename App>
void add_input_options(App* app, InputOptions& in) {
    app->add_option("token", in.token, "HC1: token text");
    app->add_option("-f,--file", in.file, "Read the token from FILE ('-' for stdin)");
    app->add_flag("--test", in.test, "Use the built-in sample token");
}

} // namespace hcert::cli
