#pragma once

#include <string>

namespace mockrun {

class HashUtils {
public:
    // Hex SHA-256 of arbitrary bytes
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Cryptographically random lowercase hex, 2 * num_bytes characters
    static std::string random_hex(size_t num_bytes);

    // exec_<epoch ms>_<random>
    static std::string generate_execution_id();
};

} // namespace mockrun
