/**
 * @file cumulus/json.h
 * @brief Linear non-strict JSON scanner
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


#ifndef CUMULUS_JSON_H
#define CUMULUS_JSON_H 1

#include "types.h"

namespace cumulus {

// linear non-strict JSON scanner
struct CUMULUS_API JSON
{
    JSON()
      : pos(nullptr)
    {
    }

    explicit JSON(const string& data)
      : pos(data.c_str())
    {
    }

    explicit JSON(const char* data)
      : pos(data)
    {
    }

    const char* pos;

    // skip a single ',' or ':'
    void skipseparator();

    m_off_t getint();

    string getname();

    bool enterarray();

    bool enterobject();
    bool leaveobject();

    bool storeobject(string* = nullptr);

    // store a string value and unescape it
    bool storestring(string&);

    static void unescape(string*);

    // Strip whitespace from a string in a JSON-safe manner.
    static string stripWhitespace(const string& text);
    static string stripWhitespace(const char* text);
};

class CUMULUS_API JSONWriter
{
public:
    JSONWriter();

    void arg(const char*, const string&, int = 1);
    void arg(const char*, const char*, int = 1);
    void arg(const char*, m_off_t);

    // For strings that may contain quotes or backslashes.
    void arg_stringWithEscapes(const char*, const string&);

    void addcomma();
    void beginarray();
    void beginarray(const char*);
    void endarray();
    void beginobject();
    void beginobject(const char*);
    void endobject();

    const string& getstring() const;

    static string escape(const char* data, size_t length);

private:
    // "name":
    void key(const char* name);

    string mJson;
}; // JSONWriter

} // namespace

#endif
