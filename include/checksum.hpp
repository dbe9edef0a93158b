#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

/**
 * Incremental SHA-256 over data as it is written to disk.
 * Lets the downloader report a digest without re-reading the file.
 */
class Sha256Digest
{
public:
    /**
     * @throws std::runtime_error if the OpenSSL context cannot be set up
     */
    Sha256Digest();

    // Feed the next chunk of bytes
    void update(const char *data, std::size_t size);

    /**
     * Finish the hash and return it hex-encoded (64 lowercase characters).
     * The digest cannot be updated afterwards.
     *
     * @throws std::runtime_error if called twice or OpenSSL fails
     */
    std::string finalHex();

    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const std::vector<unsigned char> &data);

private:
    struct ContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const noexcept
        {
            if (ctx)
                EVP_MD_CTX_free(ctx);
        }
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> context_;
    bool finished_ = false;
};
