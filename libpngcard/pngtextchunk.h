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

#include "dng_stream.h"

#include "pngchunkwalker.h"

#define TEXT_CHUNK_TYPE         "tEXt"

// Largest chunk payload allowed by the PNG format (2^31 - 1).
#define PNG_MAX_CHUNK_LENGTH    0x7FFFFFFF

// tEXt payload: keyword || 0x00 || text
class PngTextChunk
{
public:
    // Splits a tEXt chunk at its first NUL. Returns false for other chunk
    // types, for a payload without NUL and for an empty keyword.
    static bool Split(const PngChunk& chunk, std::string& keyword,
                      const uint8*& text, uint32& textLength);

    static uint64 ChunkSize(const char* keyword, uint64 textLength);

    // Serializes a complete tEXt chunk with freshly computed length and CRC.
    // The stream must be big-endian.
    static void Write(dng_stream& stream, const char* keyword, const std::string& text);
};
