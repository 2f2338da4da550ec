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

#pragma once

#include <string>

#include "dng_types.h"

class CardEncoding
{
public:
    // Standard alphabet with '=' padding.
    static std::string EncodeBase64(const std::string& bytes);

    // Accepts what a browser's atob() accepts: ASCII whitespace is ignored
    // and padding may be left off. Returns false on anything else.
    static bool DecodeBase64(const uint8* text, uint32 length, std::string& bytes);

    // Strict: rejects overlong forms, surrogates, code points above
    // U+10FFFF and truncated sequences.
    static bool IsValidUTF8(const std::string& bytes);
};
