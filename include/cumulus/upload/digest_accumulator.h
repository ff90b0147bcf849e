#pragma once

#include <cumulus/crypto/cryptopp.h>
#include <cumulus/types.h>

#include <memory>
#include <string>

namespace cumulus
{
namespace upload
{

// Computes the SHA-1 of the whole content.
//
// Data must be added strictly in offset order, independently of the
// order in which parts are confirmed by the service.
class DigestAccumulator
{
    std::unique_ptr<HashSHA1> mHash;

    // Offset of the next byte we expect.
    m_off_t mOffset;

public:
    DigestAccumulator();

    // Add data that begins at offset.
    //
    // Yields API_EARGS if offset is not where the last addition ended.
    Error add(m_off_t offset, const std::string& data);

    // Base64 encoded digest of everything added so far.
    //
    // The accumulator is reset afterwards.
    std::string finalize();

    // How many bytes have been added?
    m_off_t offset() const;

    // Discard everything added so far.
    void reset();
}; // DigestAccumulator

} // upload
} // cumulus
