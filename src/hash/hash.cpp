#include "hash.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace teldrive
{
    namespace hashing
    {
        namespace
        {
            std::string toHex(const unsigned char *data, size_t len)
            {
                std::stringstream ss;
                for (size_t i = 0; i < len; i++)
                {
                    ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
                }
                return ss.str();
            }
        }

        std::string md5Hex(const std::string &text)
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hashLen = 0;
            EVP_MD_CTX *ctx = EVP_MD_CTX_new();
            if (!ctx)
            {
                throw std::runtime_error("Failed to create EVP_MD_CTX");
            }

            if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1 ||
                EVP_DigestUpdate(ctx, text.data(), text.size()) != 1 ||
                EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1)
            {
                EVP_MD_CTX_free(ctx);
                throw std::runtime_error("Failed to compute MD5 hash");
            }

            EVP_MD_CTX_free(ctx);
            return toHex(hash, hashLen);
        }

        std::string newUuid()
        {
            unsigned char bytes[16];
            if (RAND_bytes(bytes, sizeof(bytes)) != 1)
            {
                throw std::runtime_error("Failed to generate random bytes");
            }
            bytes[6] = (bytes[6] & 0x0f) | 0x40; // version 4
            bytes[8] = (bytes[8] & 0x3f) | 0x80; // RFC 4122 variant

            std::string hex = toHex(bytes, sizeof(bytes));
            return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
                   hex.substr(16, 4) + "-" + hex.substr(20, 12);
        }
    }
}
