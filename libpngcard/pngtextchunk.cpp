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

#include "pngtextchunk.h"
#include "pngcrc.h"

#include "dng_exceptions.h"

#include <string.h>

bool PngTextChunk::Split(const PngChunk& chunk, std::string& keyword,
                         const uint8*& text, uint32& textLength)
{
    if (!chunk.IsType(TEXT_CHUNK_TYPE))
        return false;

    const uint8* separator = (const uint8*)memchr(chunk.fData, 0, chunk.fLength);
    if (separator == NULL || separator == chunk.fData)
        return false;

    uint32 keywordLength = (uint32)(separator - chunk.fData);

    keyword.assign((const char*)chunk.fData, keywordLength);
    text = separator + 1;
    textLength = chunk.fLength - keywordLength - 1;

    return true;
}

uint64 PngTextChunk::ChunkSize(const char* keyword, uint64 textLength)
{
    return PNG_CHUNK_OVERHEAD + strlen(keyword) + 1 + textLength;
}

void PngTextChunk::Write(dng_stream& stream, const char* keyword, const std::string& text)
{
    uint32 keywordLength = (uint32)strlen(keyword);

    if (keywordLength == 0 || (uint64)keywordLength + 1 + text.size() > PNG_MAX_CHUNK_LENGTH)
    {
        ThrowProgramError("tEXt payload does not fit a PNG chunk");
    }

    uint32 textLength = (uint32)text.size();
    uint32 length = keywordLength + 1 + textLength;
    const uint8 separator = 0;

    uint32 crc = PngCRC::Update(0, TEXT_CHUNK_TYPE, 4);
    crc = PngCRC::Update(crc, keyword, keywordLength);
    crc = PngCRC::Update(crc, &separator, 1);
    crc = PngCRC::Update(crc, text.data(), textLength);

    stream.Put_uint32(length);
    stream.Put(TEXT_CHUNK_TYPE, 4);
    stream.Put(keyword, keywordLength);
    stream.Put_uint8(separator);
    if (textLength > 0)
        stream.Put(text.data(), textLength);
    stream.Put_uint32(crc);
}
