#include "identityStore.hpp"
#include "ATVErrors.hpp"
#include "logger.hpp"

#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

namespace AndroidTV {

// At most one writer creates the identity, across all stores in the process.
static std::mutex gIdentityGlobalLock;

namespace {

constexpr int kRsaKeyBits = 2048;
constexpr long kCertificateSerial = 1000;
constexpr long kCertificateValiditySecs = 10L * 365 * 24 * 60 * 60;

std::string lastOpenSSLError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

bool addExtension(X509 *cert, int nid, const char *value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (!ext) {
        return false;
    }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}

std::optional<std::string> readFile(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Temp file then rename, so a reader never sees a partial file.
void writeFileAtomic(const std::filesystem::path &path, const std::string &content,
                     bool ownerOnly) {
    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot create " + tempPath.string());
        }
        if (ownerOnly) {
            std::filesystem::permissions(tempPath,
                                         std::filesystem::perms::owner_read |
                                             std::filesystem::perms::owner_write,
                                         std::filesystem::perm_options::replace);
        }
        file << content;
        file.close();
        if (file.fail()) {
            throw std::runtime_error("cannot write " + tempPath.string());
        }
    }
    std::filesystem::rename(tempPath, path);
}

} // namespace

std::string fingerprintOf(const X509 *cert) {
    if (cert == nullptr) {
        return {};
    }
    const X509_PUBKEY *pubkey = X509_get_X509_PUBKEY(cert);
    int len = i2d_X509_PUBKEY(pubkey, nullptr);
    if (len <= 0) {
        throw IdentityError("cannot encode certificate public key");
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char *p = der.data();
    i2d_X509_PUBKEY(pubkey, &p);
    return Utils::toHex(Utils::sha256(der));
}

IdentityStore::IdentityStore(std::filesystem::path storagePath, std::string clientName)
    : storagePath_(std::move(storagePath)), clientName_(std::move(clientName)) {
    if (storagePath_.empty()) {
        storagePath_ = std::filesystem::current_path();
    }
}

std::filesystem::path IdentityStore::certificatePath() const {
    return storagePath_ / "client_cert.pem";
}

std::filesystem::path IdentityStore::privateKeyPath() const {
    return storagePath_ / "client_key.pem";
}

std::shared_ptr<const Identity> IdentityStore::loadOrCreate() {
    std::lock_guard<std::mutex> lock(gIdentityGlobalLock);
    if (cached_) {
        return cached_;
    }

    if (auto identity = tryLoad()) {
        LOG_INFO("Loaded client identity {}", identity->fingerprint);
        cached_ = std::move(identity);
        return cached_;
    }

    LOG_INFO("Generating client identity for \"{}\"", clientName_);
    auto identity = generate(clientName_);
    persist(*identity);
    LOG_INFO("Stored new client identity {} in {}", identity->fingerprint,
             storagePath_.string());
    cached_ = std::move(identity);
    return cached_;
}

std::shared_ptr<const Identity> IdentityStore::tryLoad() const {
    auto certPem = readFile(certificatePath());
    auto keyPem = readFile(privateKeyPath());
    if (!certPem && !keyPem) {
        LOG_DEBUG("No identity in {}", storagePath_.string());
        return nullptr;
    }
    if (!certPem || !keyPem) {
        LOG_WARN("Incomplete identity in {}, regenerating", storagePath_.string());
        return nullptr;
    }
    auto identity = fromPem(*certPem, *keyPem);
    if (!identity) {
        LOG_WARN("Persisted identity in {} is corrupt, regenerating",
                 storagePath_.string());
    }
    return identity;
}

void IdentityStore::persist(const Identity &identity) const {
    try {
        std::filesystem::create_directories(storagePath_);
        writeFileAtomic(privateKeyPath(), identity.privateKeyPem, true);
        writeFileAtomic(certificatePath(), identity.certificatePem, false);
    } catch (const std::exception &e) {
        LOG_ERROR("Save identity error: {}", e.what());
        throw IdentityError(fmt::format("cannot store identity: {}", e.what()));
    }
}

std::shared_ptr<const Identity> IdentityStore::fromPem(std::string_view certPem,
                                                       std::string_view keyPem) {
    auto identity = std::make_shared<Identity>();
    identity->certificate = Utils::certificateFromPem(certPem);
    if (!identity->certificate) {
        ERR_clear_error();
        return nullptr;
    }
    Utils::BioPtr bio(BIO_new_mem_buf(keyPem.data(), static_cast<int>(keyPem.size())));
    if (!bio) {
        return nullptr;
    }
    identity->privateKey.reset(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!identity->privateKey ||
        X509_check_private_key(identity->certificate.get(),
                               identity->privateKey.get()) != 1) {
        ERR_clear_error();
        return nullptr;
    }
    if (EVP_PKEY_get_base_id(identity->privateKey.get()) != EVP_PKEY_RSA) {
        LOG_WARN("Persisted identity key is not RSA");
        return nullptr;
    }
    identity->certificatePem = std::string(certPem);
    identity->privateKeyPem = std::string(keyPem);
    identity->fingerprint = fingerprintOf(identity->certificate.get());
    return identity;
}

std::shared_ptr<const Identity> IdentityStore::generate(const std::string &clientName) {
    auto identity = std::make_shared<Identity>();

    Utils::EvpPkeyCtxPtr keyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    EVP_PKEY *rawKey = nullptr;
    if (!keyCtx || EVP_PKEY_keygen_init(keyCtx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(keyCtx.get(), kRsaKeyBits) <= 0 ||
        EVP_PKEY_keygen(keyCtx.get(), &rawKey) <= 0) {
        throw IdentityError(fmt::format("RSA key generation failed: {}", lastOpenSSLError()));
    }
    identity->privateKey.reset(rawKey);

    identity->certificate.reset(X509_new());
    X509 *cert = identity->certificate.get();
    if (!cert) {
        throw IdentityError("X509_new failed");
    }

    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), kCertificateSerial);
    X509_gmtime_adj(X509_getm_notBefore(cert), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert), kCertificateValiditySecs);
    X509_set_pubkey(cert, identity->privateKey.get());

    X509_NAME *name = X509_get_subject_name(cert);
    if (X509_NAME_add_entry_by_NID(
            name, NID_commonName, MBSTRING_UTF8,
            reinterpret_cast<const unsigned char *>(clientName.c_str()), -1, -1, 0) != 1) {
        throw IdentityError(fmt::format("invalid certificate name: {}", lastOpenSSLError()));
    }
    X509_set_issuer_name(cert, name);

    std::string san = "DNS:" + clientName;
    if (!addExtension(cert, NID_basic_constraints, "CA:TRUE,pathlen:0") ||
        !addExtension(cert, NID_subject_alt_name, san.c_str())) {
        throw IdentityError(fmt::format("certificate extensions failed: {}", lastOpenSSLError()));
    }

    if (X509_sign(cert, identity->privateKey.get(), EVP_sha256()) <= 0) {
        throw IdentityError(fmt::format("certificate signing failed: {}", lastOpenSSLError()));
    }

    Utils::BioPtr keyBio(BIO_new(BIO_s_mem()));
    if (!keyBio ||
        PEM_write_bio_PrivateKey_traditional(keyBio.get(), identity->privateKey.get(),
                                             nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw IdentityError("cannot PEM encode private key");
    }
    char *data = nullptr;
    long len = BIO_get_mem_data(keyBio.get(), &data);
    identity->privateKeyPem.assign(data, static_cast<size_t>(len));
    identity->certificatePem = Utils::certificatePem(cert);
    identity->fingerprint = fingerprintOf(cert);
    return identity;
}

// ':' (IPv6) and '/' are not safe in file names.
std::filesystem::path IdentityStore::peerPath(std::string_view address) const {
    std::string safe;
    safe.reserve(address.size());
    for (char c : address) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' ||
                  c == '_';
        safe.push_back(ok ? c : '_');
    }
    return storagePath_ / "peers" / (safe + ".json");
}

void IdentityStore::savePeerTrust(const PeerTrust &trust) {
    try {
        std::filesystem::create_directories(storagePath_ / "peers");

        nlohmann::json j;
        j["address"] = trust.address;
        j["fingerprint"] = trust.fingerprint;
        j["serverName"] = trust.serverName;
        j["pairedAt"] = std::chrono::system_clock::to_time_t(trust.pairedAt);

        writeFileAtomic(peerPath(trust.address), j.dump(4), false);
        LOG_DEBUG("Saved peer trust for {}", trust.address);
    } catch (const std::exception &e) {
        LOG_ERROR("Save peer error: {}", e.what());
        throw IdentityError(fmt::format("cannot store peer trust: {}", e.what()));
    }
}

std::optional<PeerTrust> IdentityStore::findPeerTrust(std::string_view address) const {
    auto text = readFile(peerPath(address));
    if (!text) {
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(*text);
        PeerTrust trust;
        trust.address = j.at("address").get<std::string>();
        trust.fingerprint = j.at("fingerprint").get<std::string>();
        trust.serverName = j.value("serverName", "");
        trust.pairedAt =
            std::chrono::system_clock::from_time_t(j.at("pairedAt").get<int64_t>());
        return trust;
    } catch (const nlohmann::json::exception &e) {
        LOG_WARN("Ignoring unreadable peer record for {}: {}", address, e.what());
        return std::nullopt;
    }
}

bool IdentityStore::deletePeerTrust(std::string_view address) {
    std::error_code ec;
    bool removed = std::filesystem::remove(peerPath(address), ec);
    if (ec) {
        LOG_ERROR("Delete peer error: {}", ec.message());
        throw IdentityError(fmt::format("cannot delete peer trust: {}", ec.message()));
    }
    return removed;
}

} // namespace AndroidTV
