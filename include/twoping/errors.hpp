#ifndef TWOPING_ERRORS_HPP
#define TWOPING_ERRORS_HPP

#include <stdint.h>

namespace twoping {

/**
 * @brief Why a datagram was not accepted as a 2ping packet.
 *
 * All kinds are local and non-fatal: the responder drops the datagram and
 * keeps serving.
 */
enum class ErrorKind : uint8_t {
    None             = 0,
    BadMagic         = 1,  ///< Not a 2ping packet
    Truncated        = 2,  ///< A declared length runs past the available bytes
    Malformed        = 3,  ///< Lengths inconsistent, or capacity bound exceeded
    ChecksumMismatch = 4   ///< Integrity check failed
};

/// @brief Stable lowercase token for logs, e.g. "checksum_mismatch".
const char* error_kind_name(ErrorKind kind);

} // namespace twoping

#endif // TWOPING_ERRORS_HPP
