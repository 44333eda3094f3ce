#include "lanbeam/wire_protocol.hpp"
#include "lanbeam/helpers.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <limits>
#include <stdexcept>

namespace lanbeam {

const std::array<unsigned char, LENGTH_PREFIX_BYTES> encode_length_prefix(const uint32_t &length) {
    return {
        static_cast<unsigned char>((length >> 24) & 0xFF),
        static_cast<unsigned char>((length >> 16) & 0xFF),
        static_cast<unsigned char>((length >> 8) & 0xFF),
        static_cast<unsigned char>(length & 0xFF)
    };
}

uint32_t decode_length_prefix(const std::array<unsigned char, LENGTH_PREFIX_BYTES> &bytes) {
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}

bool is_sha256_hex(const std::string &digest) {
    if (digest.size() != 64) {
        return false;
    }
    for (char c : digest) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

const std::string encode_manifest(const TransferManifest &manifest) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto &file : manifest.files) {
        files.push_back({
            {"rel", file.relative_name},
            {"size", file.size_bytes},
            {"sha256", file.sha256_hex}
        });
    }
    nlohmann::json doc = {
        {"file_count", manifest.fileCount()},
        {"files", files}
    };
    return doc.dump();
}

TransferManifest decode_manifest(const std::string &payload) {
    nlohmann::json doc = nlohmann::json::parse(payload, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("protocol_error: Metadata is not a JSON object");
    }
    if (!doc.contains("files") || !doc["files"].is_array()) {
        throw std::runtime_error("protocol_error: Metadata has no \"files\" array");
    }
    if (!doc.contains("file_count") || !doc["file_count"].is_number_integer()) {
        throw std::runtime_error("protocol_error: Metadata has no integer \"file_count\"");
    }

    const nlohmann::json &files = doc["files"];
    if (doc["file_count"].get<int64_t>() != static_cast<int64_t>(files.size())) {
        throw std::runtime_error("protocol_error: \"file_count\" does not match the number of listed files");
    }

    TransferManifest manifest;
    manifest.files.reserve(files.size());
    for (const auto &entry : files) {
        if (!entry.is_object()) {
            throw std::runtime_error("protocol_error: File entry is not an object");
        }
        if (!entry.contains("rel") || !entry["rel"].is_string()) {
            throw std::runtime_error("protocol_error: File entry has no string \"rel\"");
        }
        if (!entry.contains("size") || !entry["size"].is_number_integer() || entry["size"].get<int64_t>() < 0) {
            throw std::runtime_error("protocol_error: File entry has no non-negative integer \"size\"");
        }
        if (!entry.contains("sha256") || !entry["sha256"].is_string() || !is_sha256_hex(entry["sha256"].get<std::string>())) {
            throw std::runtime_error("protocol_error: File entry has no hex \"sha256\" digest");
        }

        FileDescriptor file;
        file.relative_name = entry["rel"].get<std::string>();
        file.size_bytes = entry["size"].get<uint64_t>();
        file.sha256_hex = entry["sha256"].get<std::string>();
        manifest.files.push_back(std::move(file));
    }
    return manifest;
}

void write_manifest(const int &fd, const TransferManifest &manifest) {
    const std::string payload = encode_manifest(manifest);
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("metadata_too_large: Manifest does not fit the length prefix");
    }
    auto prefix = encode_length_prefix(static_cast<uint32_t>(payload.size()));
    send_all(fd, reinterpret_cast<const char*>(prefix.data()), prefix.size());
    send_all(fd, payload.data(), payload.size());
}

TransferManifest read_manifest(const int &fd, const size_t &max_length) {
    // receive metadata length
    std::array<unsigned char, LENGTH_PREFIX_BYTES> prefix{};
    recv_exact(fd, reinterpret_cast<char*>(prefix.data()), prefix.size());
    uint32_t length = decode_length_prefix(prefix);
    if (length > max_length) {
        throw std::runtime_error("metadata_too_large: Metadata of " + std::to_string(length) +
                                 " bytes exceeds limit of " + std::to_string(max_length));
    }

    // receive metadata
    std::string payload(length, '\0');
    recv_exact(fd, payload.data(), payload.size());
    return decode_manifest(payload);
}

} // namespace lanbeam
