#include "ATVErrors.hpp"

namespace AndroidTV {

namespace {
class ATVErrorCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "androidtv"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::success:
      return "success";
    case errc::connect_failed:
      return "could not connect to device";
    case errc::tls_failed:
      return "TLS handshake failed";
    case errc::framing_error:
      return "malformed or truncated frame";
    case errc::negotiation_failed:
      return "no compatible pairing encoding";
    case errc::code_mismatch:
      return "pairing code rejected";
    case errc::pairing_failed:
      return "pairing failed";
    case errc::handshake_failed:
      return "remote session configuration rejected";
    case errc::not_connected:
      return "remote session is not connected";
    case errc::trust_changed:
      return "device identity changed, pairing required";
    case errc::timed_out:
      return "operation timed out";
    case errc::identity_error:
      return "client certificate unusable";
    case errc::protocol_violation:
      return "unexpected protocol message";
    case errc::cancelled:
      return "operation cancelled";
    case errc::config_error:
      return "invalid configuration";
    }
    return "unknown androidtv error";
  }
};
} // namespace

const boost::system::error_category &atv_category() noexcept {
  static const ATVErrorCategory category;
  return category;
}

void throwIfError(const boost::system::error_code &ec, const std::string &what) {
  if (!ec) {
    return;
  }
  if (ec.category() != atv_category()) {
    throw Error(ec, what);
  }
  switch (static_cast<errc>(ec.value())) {
  case errc::success:
    return;
  case errc::connect_failed:
    throw ConnectError(what);
  case errc::tls_failed:
    throw TlsError(what);
  case errc::framing_error:
    throw FramingError(what);
  case errc::negotiation_failed:
    throw NegotiationError(what);
  case errc::code_mismatch:
    throw CodeMismatchError(what);
  case errc::pairing_failed:
    throw PairingError(what);
  case errc::handshake_failed:
    throw HandshakeError(what);
  case errc::not_connected:
    throw NotConnectedError(what);
  case errc::trust_changed:
    throw TrustChangedError(what);
  case errc::timed_out:
    throw TimeoutError(what);
  case errc::identity_error:
    throw IdentityError(what);
  case errc::protocol_violation:
    throw ProtocolError(what);
  case errc::cancelled:
    throw CancelledError(what);
  case errc::config_error:
    throw ConfigError(what);
  }
  throw Error(ec, what);
}

std::exception_ptr makeExceptionPtr(const boost::system::error_code &ec,
                                    const std::string &what) {
  if (!ec) {
    return nullptr;
  }
  try {
    throwIfError(ec, what);
  } catch (const Error &) {
    return std::current_exception();
  }
  return nullptr;
}

} // namespace AndroidTV
