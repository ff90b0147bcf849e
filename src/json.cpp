/**
 * @file json.cpp
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


#include "cumulus/json.h"

#include <cctype>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <utf8proc.h>

#include "cumulus/logging.h"

namespace cumulus {

namespace {

int hexval(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isnumberchar(char c)
{
    return (c >= '0' && c <= '9') || (c && strchr("+-.eE", c));
}

// p points at an opening quote
// returns the position after the closing quote
const char* skipstring(const char* p)
{
    for (++p; *p && *p != '"'; ++p)
    {
        if (*p == '\\' && p[1])
        {
            ++p;
        }
    }

    if (!*p)
    {
        LOG_err << "Parse error (unterminated string)";
        return nullptr;
    }

    return p + 1;
}

// p points at '[' or '{'
// returns the position after the matching bracket
const char* skipcontainer(const char* p)
{
    string open;

    while (*p)
    {
        switch (*p)
        {
            case '"':
                if (!(p = skipstring(p)))
                {
                    return nullptr;
                }
                continue;

            case '[':
            case '{':
                open.push_back(*p);
                break;

            case ']':
            case '}':
                if (open.empty() || open.back() != (*p == ']' ? '[' : '{'))
                {
                    LOG_err << "Parse error (unbalanced " << *p << ")";
                    return nullptr;
                }

                open.pop_back();

                if (open.empty())
                {
                    return p + 1;
                }
                break;

            default:
                break;
        }

        ++p;
    }

    LOG_err << "Parse error (unterminated " << open.back() << ")";
    return nullptr;
}

// returns the position after the value starting at p
const char* skipvalue(const char* p)
{
    if (*p == '"')
    {
        return skipstring(p);
    }

    if (*p == '[' || *p == '{')
    {
        return skipcontainer(p);
    }

    if (!strncmp(p, "true", 4) || !strncmp(p, "null", 4))
    {
        return p + 4;
    }

    if (!strncmp(p, "false", 5))
    {
        return p + 5;
    }

    if (isnumberchar(*p))
    {
        while (isnumberchar(*p))
        {
            ++p;
        }

        return p;
    }

    LOG_err << "Parse error (unexpected " << *p << ")";
    return nullptr;
}

} // namespace

void JSON::skipseparator()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }
}

// store the value at pos in s and reposition after it
// strings are stored without their quotes and are not unescaped
bool JSON::storeobject(string* s)
{
    while (*pos && std::isspace(static_cast<unsigned char>(*pos)))
    {
        pos++;
    }

    skipseparator();

    if (!*pos || *pos == ']' || *pos == '}')
    {
        return false;
    }

    const char* end = skipvalue(pos);

    if (!end)
    {
        return false;
    }

    if (s)
    {
        if (*pos == '"')
        {
            s->assign(pos + 1, end - 1);
        }
        else
        {
            s->assign(pos, end);
        }
    }

    pos = end;
    return true;
}

bool JSON::storestring(string& value)
{
    skipseparator();

    if (*pos != '"' || !storeobject(&value))
    {
        return false;
    }

    unescape(&value);
    return true;
}

// reads "name": and returns name
// returns an empty string and leaves pos alone if there's no name
string JSON::getname()
{
    const char* ptr = pos;

    if (*ptr == ',' || *ptr == ':')
    {
        ptr++;
    }

    if (*ptr != '"')
    {
        return string();
    }

    const char* end = strchr(ptr + 1, '"');

    if (!end)
    {
        return string();
    }

    pos = end[1] == ':' ? end + 2 : end + 1;

    return string(ptr + 1, end);
}

// integers may be quoted
// returns -1 if the value isn't numeric
m_off_t JSON::getint()
{
    skipseparator();

    const char* digits = pos + (*pos == '"');
    bool numeric = (*digits >= '0' && *digits <= '9') || *digits == '-';

    if (!numeric)
    {
        LOG_err << "Parse error (getint)";
    }

    m_off_t value = numeric ? static_cast<m_off_t>(atoll(digits)) : -1;

    storeobject();
    return value;
}

bool JSON::enterarray()
{
    skipseparator();

    if (*pos != '[')
    {
        return false;
    }

    pos++;
    return true;
}

bool JSON::enterobject()
{
    skipseparator();

    if (*pos != '{')
    {
        return false;
    }

    pos++;
    return true;
}

// skip whatever's left of the current object
bool JSON::leaveobject()
{
    while (*pos && *pos != '}')
    {
        if (*pos == ',' || *pos == ':' || *pos == ' ')
        {
            pos++;
            continue;
        }

        const char* end = skipvalue(pos);

        if (!end)
        {
            break;
        }

        pos = end;
    }

    if (*pos != '}')
    {
        LOG_err << "Parse error (leaveobject)";
        return false;
    }

    pos++;
    return true;
}

// unescape a JSON string in place
// malformed escapes are left alone
void JSON::unescape(string* s)
{
    string result;
    size_t i = 0;

    result.reserve(s->size());

    while (i < s->size())
    {
        char c = (*s)[i];

        if (c != '\\' || i + 1 == s->size())
        {
            result.push_back(c);
            i++;
            continue;
        }

        char kind = (*s)[i + 1];

        if (kind != 'u')
        {
            switch (kind)
            {
                case 'n': result.push_back('\n'); break;
                case 'r': result.push_back('\r'); break;
                case 'b': result.push_back('\b'); break;
                case 'f': result.push_back('\f'); break;
                case 't': result.push_back('\t'); break;
                default: result.push_back(kind); break;
            }

            i += 2;
            continue;
        }

        utf8proc_int32_t codepoint = 0;
        size_t j = i + 2;

        for (; j < i + 6 && j < s->size(); ++j)
        {
            int v = hexval((*s)[j]);

            if (v < 0)
            {
                break;
            }

            codepoint = (codepoint << 4) | v;
        }

        if (j != i + 6)
        {
            result.push_back(c);
            i++;
            continue;
        }

        utf8proc_uint8_t buffer[4];
        auto length = utf8proc_encode_char(codepoint, buffer);

        result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
        i += 6;
    }

    s->swap(result);
}

string JSON::stripWhitespace(const string& text)
{
    return stripWhitespace(text.c_str());
}

string JSON::stripWhitespace(const char* text)
{
    string result;

    while (*text)
    {
        if (*text == '"')
        {
            const char* end = skipstring(text);

            if (!end)
            {
                result.append(text);
                break;
            }

            result.append(text, end);
            text = end;
        }
        else if (std::isspace(static_cast<unsigned char>(*text)))
        {
            text++;
        }
        else
        {
            result.push_back(*text++);
        }
    }

    return result;
}

JSONWriter::JSONWriter()
  : mJson()
{
}

void JSONWriter::key(const char* name)
{
    addcomma();
    mJson.push_back('"');
    mJson.append(name);
    mJson.append("\":");
}

void JSONWriter::arg(const char* name, const string& value, int quotes)
{
    arg(name, value.c_str(), quotes);
}

void JSONWriter::arg(const char* name, const char* value, int quotes)
{
    key(name);

    if (quotes)
    {
        mJson.push_back('"');
        mJson.append(value);
        mJson.push_back('"');
    }
    else
    {
        mJson.append(value);
    }
}

void JSONWriter::arg_stringWithEscapes(const char* name, const string& value)
{
    arg(name, escape(value.c_str(), value.size()));
}

void JSONWriter::arg(const char* name, m_off_t n)
{
    char buf[32];

    snprintf(buf, sizeof(buf), "%" PRId64, n);

    arg(name, buf, 0);
}

void JSONWriter::addcomma()
{
    if (!mJson.empty() && mJson.back() != '[' && mJson.back() != '{')
    {
        mJson.push_back(',');
    }
}

void JSONWriter::beginarray()
{
    addcomma();
    mJson.push_back('[');
}

void JSONWriter::beginarray(const char* name)
{
    key(name);
    mJson.push_back('[');
}

void JSONWriter::endarray()
{
    mJson.push_back(']');
}

void JSONWriter::beginobject()
{
    addcomma();
    mJson.push_back('{');
}

void JSONWriter::beginobject(const char* name)
{
    key(name);
    mJson.push_back('{');
}

void JSONWriter::endobject()
{
    mJson.push_back('}');
}

const string& JSONWriter::getstring() const
{
    return mJson;
}

string JSONWriter::escape(const char* data, size_t length)
{
    const utf8proc_uint8_t* current = reinterpret_cast<const utf8proc_uint8_t *>(data);
    utf8proc_ssize_t remaining = static_cast<utf8proc_ssize_t>(length);
    utf8proc_int32_t codepoint = 0;
    string result;

    while (remaining > 0)
    {
        auto read = utf8proc_iterate(current, remaining, &codepoint);

        // invalid sequences are copied through byte by byte
        if (read < 1)
        {
            result.push_back(static_cast<char>(*current++));
            --remaining;
            continue;
        }

        current += read;
        remaining -= read;

        if (read > 1)
        {
            result.append(current - read, current);
            continue;
        }

        switch (codepoint)
        {
        case '"':
            result.append("\\\"");
            break;
        case '\\':
            result.append("\\\\");
            break;
        case '\n':
            result.append("\\n");
            break;
        case '\r':
            result.append("\\r");
            break;
        case '\t':
            result.append("\\t");
            break;
        default:
            if (codepoint < 0x20)
            {
                char buf[8];

                snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(codepoint));
                result.append(buf);
                break;
            }

            result.push_back(static_cast<char>(current[-1]));
            break;
        }
    }

    return result;
}

} // namespace
