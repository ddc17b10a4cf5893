#ifndef ATV_UTILS_HPP
#define ATV_UTILS_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace AndroidTV {
namespace Utils {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

struct X509Deleter {
    void operator()(X509 *cert) const { X509_free(cert); }
};
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

struct BignumDeleter {
    void operator()(BIGNUM *bn) const { BN_free(bn); }
};
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

struct BioDeleter {
    void operator()(BIO *bio) const { BIO_free_all(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// Unsigned big-endian, no leading zero bytes (65537 -> 01 00 01).
struct RsaPublicComponents {
    std::vector<uint8_t> modulus;
    std::vector<uint8_t> exponent;
};

std::vector<uint8_t> sha256(const std::vector<uint8_t> &data);

// Lowercase hex.
std::string toHex(const uint8_t *data, size_t len);
inline std::string toHex(const std::vector<uint8_t> &data) {
    return toHex(data.data(), data.size());
}

// Accepts upper and lower case. nullopt on odd length or a non-hex symbol.
std::optional<std::vector<uint8_t>> fromHex(std::string_view hex);

std::vector<uint8_t> bignumToBytes(const BIGNUM *bn);

// Throws IdentityError when the key is not RSA.
RsaPublicComponents rsaPublicComponents(const EVP_PKEY *key);
RsaPublicComponents rsaPublicComponents(const X509 *cert);

std::vector<uint8_t> certificateDer(const X509 *cert);
std::string certificatePem(const X509 *cert);
X509Ptr certificateFromPem(std::string_view pem);
X509Ptr certificateFromDer(const std::vector<uint8_t> &der);

// Subject CN, empty if absent.
std::string certificateCommonName(const X509 *cert);

} // namespace Utils
} // namespace AndroidTV

#endif // ATV_UTILS_HPP
