/**
 * @file cumulus/base64.h
 * @brief Base64 encoding/decoding
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


#ifndef CUMULUS_BASE64_H
#define CUMULUS_BASE64_H 1

#include "types.h"

namespace cumulus {

// standard base64 (RFC 4648 alphabet, '=' padded)
class CUMULUS_API Base64
{
public:
    static string btoa(const string& in);

    // decoding stops at the first character outside the alphabet
    // the URL-safe alphabet is accepted too
    static string atob(const string& in);
};

} // namespace

#endif
