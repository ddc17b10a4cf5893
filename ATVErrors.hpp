#ifndef ATV_ERRORS_HPP
#define ATV_ERRORS_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <string>
#include <type_traits>

namespace AndroidTV {

// Error codes carried by asynchronous completion handlers. Synchronous entry
// points turn them into the matching exception type via throwIfError().
enum class errc {
  success = 0,
  connect_failed,     // host unreachable, refused, unresolvable
  tls_failed,         // TLS handshake failure
  framing_error,      // malformed or truncated frame, connection unusable
  negotiation_failed, // no pairing encoding in common with the peer
  code_mismatch,      // wrong out-of-band code
  pairing_failed,     // peer reported a generic pairing failure
  handshake_failed,   // remote session configuration rejected
  not_connected,      // command submitted while not connected
  trust_changed,      // peer identity differs from the paired one
  timed_out,          // bounded wait exceeded
  identity_error,     // certificate material unusable
  protocol_violation, // unexpected message for the current state
  cancelled,          // caller cancelled / stopped
  config_error        // unusable configuration file
};

} // namespace AndroidTV

namespace boost {
namespace system {
template <> struct is_error_code_enum<AndroidTV::errc> : std::true_type {};
} // namespace system
} // namespace boost

namespace AndroidTV {

const boost::system::error_category &atv_category() noexcept;

inline boost::system::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), atv_category()};
}

class Error : public boost::system::system_error {
public:
  explicit Error(boost::system::error_code ec, const std::string &what = "")
      : boost::system::system_error(ec, what) {}
  explicit Error(errc e, const std::string &what = "")
      : boost::system::system_error(make_error_code(e), what) {}
};

#define ATV_DECLARE_ERROR(Name, Code)                                          \
  class Name : public Error {                                                  \
  public:                                                                      \
    explicit Name(const std::string &what = "") : Error(errc::Code, what) {}   \
  }

ATV_DECLARE_ERROR(ConnectError, connect_failed);
ATV_DECLARE_ERROR(TlsError, tls_failed);
ATV_DECLARE_ERROR(FramingError, framing_error);
ATV_DECLARE_ERROR(NegotiationError, negotiation_failed);
ATV_DECLARE_ERROR(CodeMismatchError, code_mismatch);
ATV_DECLARE_ERROR(PairingError, pairing_failed);
ATV_DECLARE_ERROR(HandshakeError, handshake_failed);
ATV_DECLARE_ERROR(NotConnectedError, not_connected);
ATV_DECLARE_ERROR(TrustChangedError, trust_changed);
ATV_DECLARE_ERROR(TimeoutError, timed_out);
ATV_DECLARE_ERROR(IdentityError, identity_error);
ATV_DECLARE_ERROR(ProtocolError, protocol_violation);
ATV_DECLARE_ERROR(CancelledError, cancelled);
ATV_DECLARE_ERROR(ConfigError, config_error);

#undef ATV_DECLARE_ERROR

// Throws the typed exception matching ec. Codes from other categories
// (asio, ssl) are thrown as plain Error. No-op for success.
void throwIfError(const boost::system::error_code &ec,
                  const std::string &what = "");

// The exception throwIfError would raise, for handing across threads.
std::exception_ptr makeExceptionPtr(const boost::system::error_code &ec,
                                    const std::string &what = "");

} // namespace AndroidTV

#endif // ATV_ERRORS_HPP
