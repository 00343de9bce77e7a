// ChecksumService.cpp
#include "ChecksumService.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string ChecksumService::compute(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file for checksum: " + filePath.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 init failed");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed: " + filePath.string());
        }
    }
    if (file.bad()) {
        throw std::runtime_error("read error while hashing: " + filePath.string());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 final failed");
    }

    std::ostringstream result;
    for (unsigned int i = 0; i < length; i++) {
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return result.str();
}

std::map<std::string, std::string> ChecksumService::computeTree(const fs::path& root) const {
    std::map<std::string, std::string> digests;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            digests[entry.path().lexically_relative(root).generic_string()] = compute(entry.path());
        }
    }
    return digests;
}

std::vector<std::string> ChecksumService::compareTrees(const fs::path& source, const fs::path& destination) const {
    std::vector<std::string> mismatches;
    auto expected = computeTree(source);
    auto actual = computeTree(destination);

    for (const auto& [relPath, digest] : expected) {
        auto it = actual.find(relPath);
        if (it == actual.end()) {
            mismatches.push_back("missing in copy: " + relPath);
        } else if (it->second != digest) {
            mismatches.push_back("checksum mismatch: " + relPath);
        }
    }
    return mismatches;
}
