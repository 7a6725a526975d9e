#include "CryptoUtils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string CryptoUtils::sha256_to_hex(const std::string& input) {
    return sha256_to_hex(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

std::string CryptoUtils::sha256_to_hex(const uint8_t* data, size_t size) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, size, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string CryptoUtils::sha256_to_hex(const std::vector<uint8_t>& data) {
    return sha256_to_hex(data.data(), data.size());
}

std::string CryptoUtils::to_hex(const unsigned char* bytes, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)bytes[i];
    }
    return oss.str();
}

Sha256Stream::Sha256Stream() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to initialise SHA-256 digest");
    }
}

Sha256Stream::~Sha256Stream() {
    EVP_MD_CTX_free(ctx);
}

void Sha256Stream::update(const uint8_t* data, size_t size) {
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256Stream::finish_hex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return CryptoUtils::to_hex(hash, length);
}
