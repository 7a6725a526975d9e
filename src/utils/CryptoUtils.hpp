#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <openssl/evp.h>

class CryptoUtils {
public:
    static std::string sha256_to_hex(const std::string& input);
    static std::string sha256_to_hex(const uint8_t* data, size_t size);
    static std::string sha256_to_hex(const std::vector<uint8_t>& data);
    static std::string to_hex(const unsigned char* bytes, size_t size);
};

// Incremental SHA-256 for bodies that are streamed rather than held in memory.
class Sha256Stream {
private:
    EVP_MD_CTX* ctx;

public:
    Sha256Stream();
    ~Sha256Stream();
    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const uint8_t* data, size_t size);
    std::string finish_hex();
};
