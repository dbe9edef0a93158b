#include "checksum.hpp"

#include <stdexcept>

Sha256Digest::Sha256Digest() : context_(EVP_MD_CTX_new())
{
    // EVP = "Envelope" API (high-level cryptography interface)
    if (!context_)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
}

void Sha256Digest::update(const char *data, std::size_t size)
{
    if (finished_)
    {
        throw std::runtime_error("SHA-256 digest already finalized");
    }

    if (size == 0)
    {
        return;
    }

    if (EVP_DigestUpdate(context_.get(), data, size) != 1)
    {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
}

std::string Sha256Digest::finalHex()
{
    if (finished_)
    {
        throw std::runtime_error("SHA-256 digest already finalized");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context_.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    finished_ = true;

    std::vector<unsigned char> hashVector(hash, hash + hashLength);
    return toHex(hashVector);
}

std::string Sha256Digest::toHex(const std::vector<unsigned char> &data)
{
    static const char digits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(data.size() * 2);
    for (unsigned char byte : data)
    {
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0F]);
    }
    return hex;
}
