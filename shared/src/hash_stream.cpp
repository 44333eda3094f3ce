#include "lanbeam/hash_stream.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace lanbeam {

HashStream::HashStream() {
    if (sodium_init() < 0) {
        throw std::runtime_error("crypto_init_failed: libsodium could not be initialized");
    }
    crypto_hash_sha256_init(&this->state);
}

void HashStream::update(const char *data, const size_t &length) {
    crypto_hash_sha256_update(&this->state, reinterpret_cast<const unsigned char*>(data), length);
    this->bytes_hashed += length;
}

void HashStream::update(const std::string &chunk) {
    this->update(chunk.data(), chunk.size());
}

const std::string HashStream::digest() const {
    // finalize a copy so the running state can keep absorbing bytes
    crypto_hash_sha256_state copy = this->state;
    unsigned char out[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&copy, out);

    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), out, sizeof(out));
    return std::string(hex);
}

size_t HashStream::bytesHashed() const {
    return this->bytes_hashed;
}

const std::string sha256_file(const std::string &path, const size_t &chunk_size) {
    std::ifstream infile(path, std::ios::binary);
    if (!infile) {
        throw std::runtime_error("file_open_failed: Failed to open file for hashing (path: " + path + ")");
    }

    HashStream hash;
    std::vector<char> buffer(chunk_size);
    while (infile) {
        infile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read_bytes = infile.gcount();
        if (read_bytes <= 0) {
            break;
        }
        hash.update(buffer.data(), static_cast<size_t>(read_bytes));
    }
    if (infile.bad()) {
        throw std::runtime_error("file_read_failed: Failed to read file for hashing (path: " + path + ")");
    }
    return hash.digest();
}

bool digests_equal(const std::string &a, const std::string &b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace lanbeam
