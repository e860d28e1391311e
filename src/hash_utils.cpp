#include "hash_utils.h"
#include "errors.h"
#include <sstream>
#include <iomanip>
#include <vector>
#include <chrono>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace mockrun {

std::string HashUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string HashUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> buf(num_bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw InternalError("RAND_bytes failed");
    }
    return bytes_to_hex(buf.data(), buf.size());
}

std::string HashUtils::generate_execution_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "exec_" + std::to_string(ms) + "_" + random_hex(5).substr(0, 9);
}

} // namespace mockrun
