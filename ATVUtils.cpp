#include "ATVUtils.hpp"
#include "ATVErrors.hpp"
#include "logger.hpp"

#include <openssl/core_names.h>
#include <openssl/pem.h>
#include <openssl/sha.h>

namespace AndroidTV {
namespace Utils {

std::vector<uint8_t> sha256(const std::vector<uint8_t> &data) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    unsigned int len = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        throw Error(errc::identity_error, "SHA-256 digest failed");
    }
    digest.resize(len);
    return digest;
}

std::string toHex(const uint8_t *data, size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<uint8_t>> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::vector<uint8_t> bignumToBytes(const BIGNUM *bn) {
    std::vector<uint8_t> out(static_cast<size_t>(BN_num_bytes(bn)));
    if (!out.empty()) {
        BN_bn2bin(bn, out.data());
    }
    return out;
}

RsaPublicComponents rsaPublicComponents(const EVP_PKEY *key) {
    if (key == nullptr || EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) {
        throw IdentityError("certificate key is not RSA");
    }
    BIGNUM *n = nullptr;
    BIGNUM *e = nullptr;
    if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &n) != 1) {
        throw IdentityError("cannot read RSA modulus");
    }
    BignumPtr modulus(n);
    if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_E, &e) != 1) {
        throw IdentityError("cannot read RSA exponent");
    }
    BignumPtr exponent(e);
    return {bignumToBytes(modulus.get()), bignumToBytes(exponent.get())};
}

RsaPublicComponents rsaPublicComponents(const X509 *cert) {
    if (cert == nullptr) {
        throw IdentityError("no certificate");
    }
    // X509_get0_pubkey does not take ownership
    return rsaPublicComponents(X509_get0_pubkey(cert));
}

std::vector<uint8_t> certificateDer(const X509 *cert) {
    int len = i2d_X509(cert, nullptr);
    if (len <= 0) {
        throw IdentityError("cannot DER encode certificate");
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char *p = der.data();
    i2d_X509(cert, &p);
    return der;
}

std::string certificatePem(const X509 *cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw IdentityError("cannot PEM encode certificate");
    }
    char *data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

X509Ptr certificateFromPem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

X509Ptr certificateFromDer(const std::vector<uint8_t> &der) {
    const unsigned char *p = der.data();
    return X509Ptr(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
}

std::string certificateCommonName(const X509 *cert) {
    if (cert == nullptr) {
        return {};
    }
    const X509_NAME *subject = X509_get_subject_name(cert);
    int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) {
        return {};
    }
    const X509_NAME_ENTRY *entry = X509_NAME_get_entry(subject, idx);
    const ASN1_STRING *data = X509_NAME_ENTRY_get_data(entry);
    unsigned char *utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) {
        LOG_WARN("Certificate CN is not convertible to UTF-8");
        return {};
    }
    std::string cn(reinterpret_cast<char *>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return cn;
}

} // namespace Utils
} // namespace AndroidTV
