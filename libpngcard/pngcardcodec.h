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

#include "dng_memory.h"
#include "dng_stream.h"

#include "pngchunkwalker.h"

enum CardKeyword
{
    ckChara = 0,    // "chara"
    ckCcv3  = 1     // "ccv3"
};

const char* CardKeywordName(CardKeyword keyword);
bool ParseCardKeyword(const std::string& name, CardKeyword& keyword);

struct PngCard
{
    PngCard() : fKeyword(ckChara) {}

    CardKeyword fKeyword;
    std::string fJsonText;
};

class PngCardOptions
{
public:
    PngCardOptions() : fWriteChara(true), fWriteCcv3(true) {}

    bool fWriteChara;
    bool fWriteCcv3;
};

// Reads and writes a character card stored as base64 UTF-8 JSON in the
// "chara" and "ccv3" tEXt chunks of a PNG. All other chunks pass through
// byte for byte.
class PngCardCodec
{
public:
    PngCardCodec(dng_memory_allocator& allocator = gDefaultDNGMemoryAllocator);
    ~PngCardCodec(void);

    // Finds the first chara or ccv3 tEXt chunk in file order. Returns false
    // when there is none, including when data is not a PNG at all. Throws
    // PngCardException (pngcard_error_decode) when the first match does not
    // decode; later chunks are not tried.
    bool Extract(const uint8* data, uint64 length, PngCard& card) const;

    // Same, restricted to one slot.
    bool Extract(const uint8* data, uint64 length, CardKeyword keyword, PngCard& card) const;

    // Writes data to stream with every existing card slot removed and the
    // requested slots inserted right before IEND. Throws PngCardException
    // with pngcard_error_not_a_png, pngcard_error_truncated_png or
    // pngcard_error_decode (jsonText not UTF-8).
    void Embed(const uint8* data, uint64 length, const std::string& jsonText,
               const PngCardOptions& options, dng_stream& stream) const;

    // Caller owns the returned block.
    dng_memory_block* Embed(const uint8* data, uint64 length, const std::string& jsonText,
                            const PngCardOptions& options = PngCardOptions()) const;

    // Removes every card slot. Same failures as Embed.
    dng_memory_block* Strip(const uint8* data, uint64 length) const;

private:
    bool ExtractMatching(const uint8* data, uint64 length, const CardKeyword* only, PngCard& card) const;

    dng_memory_allocator& m_Allocator;
};
