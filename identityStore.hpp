#ifndef ATV_IDENTITY_STORE_HPP
#define ATV_IDENTITY_STORE_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "ATVUtils.hpp"

namespace AndroidTV {

// The client's self-signed certificate and key. Never mutated after creation.
struct Identity {
    Utils::X509Ptr certificate;
    Utils::EvpPkeyPtr privateKey;
    std::string certificatePem;
    std::string privateKeyPem;
    std::string fingerprint;
};

// Outcome of a successful pairing with one device.
struct PeerTrust {
    std::string address;
    std::string fingerprint;
    std::string serverName;
    std::chrono::system_clock::time_point pairedAt;
};

// Lowercase hex SHA-256 of the certificate's DER SubjectPublicKeyInfo.
std::string fingerprintOf(const X509 *cert);

// Layout below the storage path:
//   client_cert.pem, client_key.pem   the Identity
//   peers/<address>.json              one PeerTrust per device
class IdentityStore {
  public:
    IdentityStore(std::filesystem::path storagePath, std::string clientName);

    IdentityStore(const IdentityStore &) = delete;
    IdentityStore &operator=(const IdentityStore &) = delete;

    // Reads the persisted identity, generating and persisting a new one if it
    // is missing or unparsable. Throws IdentityError if generation or the
    // write fails.
    std::shared_ptr<const Identity> loadOrCreate();

    void savePeerTrust(const PeerTrust &trust);
    std::optional<PeerTrust> findPeerTrust(std::string_view address) const;
    bool deletePeerTrust(std::string_view address);

    std::filesystem::path certificatePath() const;
    std::filesystem::path privateKeyPath() const;
    const std::filesystem::path &storagePath() const { return storagePath_; }

    // RSA-2048, SHA-256 signed, CN and DNS SAN = clientName, valid 10 years.
    static std::shared_ptr<const Identity> generate(const std::string &clientName);

    // Nullptr if the PEM pair does not parse or the key does not match.
    static std::shared_ptr<const Identity> fromPem(std::string_view certPem,
                                                   std::string_view keyPem);

  private:
    std::shared_ptr<const Identity> tryLoad() const;
    void persist(const Identity &identity) const;
    std::filesystem::path peerPath(std::string_view address) const;

    std::filesystem::path storagePath_;
    std::string clientName_;
    std::shared_ptr<const Identity> cached_;
};

} // namespace AndroidTV

#endif // ATV_IDENTITY_STORE_HPP
