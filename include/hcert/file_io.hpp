#pragma once

/*
 * Small file helpers shared by the config loaders and the CLI.
 */

#include "hcert/types.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace hcert {
namespace fs {

/**
 * Read entire file as string.
 */
inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Read entire file as bytes.
 */
inline std::optional<Bytes> read_binary_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace fs
} // namespace hcert
