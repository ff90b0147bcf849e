/**
 * @file base64.cpp
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


#include "cumulus/base64.h"

namespace cumulus {

namespace {

const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 64 if c isn't part of either alphabet
unsigned sextet(char c)
{
    if (c >= 'A' && c <= 'Z') return static_cast<unsigned>(c - 'A');
    if (c >= 'a' && c <= 'z') return static_cast<unsigned>(c - 'a' + 26);
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0' + 52);
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return 64;
}

} // namespace

string Base64::btoa(const string& in)
{
    string out;
    size_t i = 0;

    out.reserve((in.size() + 2) / 3 * 4);

    for (; i + 2 < in.size(); i += 3)
    {
        unsigned group = static_cast<byte>(in[i]) << 16
                       | static_cast<byte>(in[i + 1]) << 8
                       | static_cast<byte>(in[i + 2]);

        out.push_back(alphabet[group >> 18 & 63]);
        out.push_back(alphabet[group >> 12 & 63]);
        out.push_back(alphabet[group >> 6 & 63]);
        out.push_back(alphabet[group & 63]);
    }

    size_t left = in.size() - i;

    if (left)
    {
        unsigned group = static_cast<unsigned>(static_cast<byte>(in[i]) << 16);

        if (left > 1)
        {
            group |= static_cast<unsigned>(static_cast<byte>(in[i + 1]) << 8);
        }

        out.push_back(alphabet[group >> 18 & 63]);
        out.push_back(alphabet[group >> 12 & 63]);
        out.push_back(left > 1 ? alphabet[group >> 6 & 63] : '=');
        out.push_back('=');
    }

    return out;
}

string Base64::atob(const string& in)
{
    string out;
    unsigned buffer = 0;
    int bits = 0;

    out.reserve(in.size() * 3 / 4);

    for (char c : in)
    {
        unsigned value = sextet(c);

        if (value == 64)
        {
            break;
        }

        buffer = (buffer << 6 | value) & 0xffffff;
        bits += 6;

        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<char>(buffer >> bits & 0xff));
        }
    }

    return out;
}

} // namespace
