/* This file is part of the pngcard project
   Copyright (C) 2011 Jens Mueller <tschensensinger at gmx dot de>

   This library is free software; you can redistribute it and/or
   modify it under the terms of the GNU Library General Public
   License as published by the Free Software Foundation; either
   version 2 of the License, or (at your option) any later version.

   This library is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
   Library General Public License for more details.

   You should have received a copy of the GNU Library General Public License
   along with this library; see the file COPYING.  If not, write to
   the Free Software Foundation, Inc., 51 Franklin Street, Fifth Floor,
   Boston, MA 02110-1301, USA.
*/

#include "cardencoding.h"

#include <vector>

#include "dng_exceptions.h"

#include <exiv2/futils.hpp>

static bool IsBase64Char(uint8 c)
{
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

static bool IsAsciiWhitespace(uint8 c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

std::string CardEncoding::EncodeBase64(const std::string& bytes)
{
    if (bytes.empty())
        return std::string();

    size_t encodedLength = 4 * ((bytes.size() + 2) / 3);
    std::vector<char> buffer(encodedLength + 1);

    if (!Exiv2::base64encode(bytes.data(), bytes.size(), &buffer[0], buffer.size()))
        ThrowProgramError("base64 buffer too small");

    return std::string(&buffer[0], encodedLength);
}

bool CardEncoding::DecodeBase64(const uint8* text, uint32 length, std::string& bytes)
{
    bytes.clear();

    std::string clean;
    clean.reserve(length);
    for (uint32 i = 0; i < length; i++)
    {
        if (!IsAsciiWhitespace(text[i]))
            clean.push_back((char)text[i]);
    }

    if (clean.size() % 4 == 0)
    {
        for (int pad = 0; pad < 2 && !clean.empty() && clean[clean.size() - 1] == '='; pad++)
            clean.erase(clean.size() - 1);
    }

    if (clean.size() % 4 == 1)
        return false;

    for (size_t i = 0; i < clean.size(); i++)
    {
        if (!IsBase64Char((uint8)clean[i]))
            return false;
    }

    if (clean.empty())
        return true;

    while (clean.size() % 4 != 0)
        clean.push_back('=');

    size_t decodedLength = clean.size() / 4 * 3;
    std::vector<char> buffer(decodedLength + 2);

    long count = (long)Exiv2::base64decode(clean.c_str(), &buffer[0], buffer.size());
    if (count <= 0)
        return false;

    bytes.assign(&buffer[0], (size_t)count);
    return true;
}

bool CardEncoding::IsValidUTF8(const std::string& bytes)
{
    const uint8* s = (const uint8*)bytes.data();
    size_t n = bytes.size();
    size_t i = 0;

    while (i < n)
    {
        uint8 c = s[i];

        if (c < 0x80)
        {
            i++;
            continue;
        }

        uint32 extra;
        uint8 lower = 0x80;
        uint8 upper = 0xBF;

        if (c >= 0xC2 && c <= 0xDF)
        {
            extra = 1;
        }
        else if (c >= 0xE0 && c <= 0xEF)
        {
            extra = 2;
            if (c == 0xE0)
                lower = 0xA0;       // overlong
            else if (c == 0xED)
                upper = 0x9F;       // surrogates
        }
        else if (c >= 0xF0 && c <= 0xF4)
        {
            extra = 3;
            if (c == 0xF0)
                lower = 0x90;       // overlong
            else if (c == 0xF4)
                upper = 0x8F;       // above U+10FFFF
        }
        else
        {
            return false;
        }

        if (n - i <= extra)
            return false;

        if (s[i + 1] < lower || s[i + 1] > upper)
            return false;

        for (uint32 k = 2; k <= extra; k++)
        {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF)
                return false;
        }

        i += extra + 1;
    }

    return true;
}
