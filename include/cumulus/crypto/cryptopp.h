/**
 * @file cumulus/crypto/cryptopp.h
 * @brief Crypto layer using Crypto++
 *
 * (c) 2026 by the Cumulus SDK authors
 *
 * This file is part of the Cumulus SDK - Client Access Engine.
 *
 * The Cumulus SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */


#ifndef CUMULUS_CRYPTO_CRYPTOPP_H
#define CUMULUS_CRYPTO_CRYPTOPP_H 1

#include <cryptopp/cryptlib.h>
#include <cryptopp/osrng.h>
#include <cryptopp/sha.h>

#include "cumulus/types.h"

namespace cumulus {

/**
 * @brief A generic pseudo-random number generator.
 *
 * Instances are not thread safe.
 */
class CUMULUS_API PrnGen : public CryptoPP::AutoSeededRandomPool
{
public:
    /**
     * @brief Generates a block of random bytes of length `len` into a buffer
     *        `buf`.
     *
     * @param buf The buffer that takes the generated random bytes. Ensure that
     *     the buffer is of sufficient size to take `len` bytes.
     * @param len The number of random bytes to generate.
     */
    void genblock(byte* buf, size_t len);

    /**
     * @brief Generates a random integer between 0 ... max - 1.
     *
     * @param max The maximum of which the number is to generate under.
     * @return The random number generated.
     */
    uint32_t genuint32(uint64_t max);
};

// SHA-1, as used by the service for part and whole file digests
class CUMULUS_API HashSHA1
{
    CryptoPP::SHA1 hash;

public:
    static const size_t DIGESTSIZE = CryptoPP::SHA1::DIGESTSIZE;

    void add(const byte*, size_t);

    // retrieves the digest and restarts the hash
    void get(std::string*);

    // one-shot digest of a buffer
    static std::string digest(const std::string& data);
};

} // namespace

#endif
