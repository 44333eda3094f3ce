#pragma once

#include <sodium.h>

#include <string>

namespace lanbeam {

// incremental SHA-256, one instance per file per direction
class HashStream {
public:
    HashStream();

    void update(const char *data, const size_t &length);
    void update(const std::string &chunk);

    // lowercase hex digest of everything fed so far, state keeps running
    const std::string digest() const;

    size_t bytesHashed() const;

private:
    crypto_hash_sha256_state state;
    size_t bytes_hashed = 0;
};

const std::string sha256_file(const std::string &path, const size_t &chunk_size = 1024 * 1024);

bool digests_equal(const std::string &a, const std::string &b);

} // namespace lanbeam
