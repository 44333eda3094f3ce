#pragma once

#include "transfer_types.hpp"

#include <array>
#include <string>

namespace lanbeam {

constexpr size_t LENGTH_PREFIX_BYTES = 4;

/*
 * Transfer framing:
 *   4 bytes   big-endian metadata length L
 *   L bytes   UTF-8 JSON {"file_count": n, "files": [{"rel", "size", "sha256"}, ...]}
 *   then the raw bytes of every file in manifest order, exactly "size" bytes each
 */

const std::array<unsigned char, LENGTH_PREFIX_BYTES> encode_length_prefix(const uint32_t &length);
uint32_t decode_length_prefix(const std::array<unsigned char, LENGTH_PREFIX_BYTES> &bytes);

const std::string encode_manifest(const TransferManifest &manifest);
TransferManifest decode_manifest(const std::string &payload);

// blocking helpers over a connected stream socket
void write_manifest(const int &fd, const TransferManifest &manifest);
// max_length comes from EngineConfig::max_metadata_bytes
TransferManifest read_manifest(const int &fd, const size_t &max_length);

bool is_sha256_hex(const std::string &digest);

} // namespace lanbeam
