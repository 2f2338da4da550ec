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

#include "pngchunkwalker.h"
#include "pngcardglobals.h"
#include "pngcrc.h"

#include <stdio.h>
#include <string.h>

static uint32 GetUint32BE(const uint8* p)
{
    return ((uint32)p[0] << 24) |
           ((uint32)p[1] << 16) |
           ((uint32)p[2] <<  8) |
           ((uint32)p[3]);
}

bool HasPngSignature(const uint8* data, uint64 length)
{
    if (data == NULL || length < PNG_SIGNATURE_LEN)
        return false;

    return memcmp(data, PNG_SIGNATURE_DATA, PNG_SIGNATURE_LEN) == 0;
}

PngChunk::PngChunk()
    : fOffset(0), fLength(0), fData(NULL), fCRC(0)
{
    memset(fType, 0, sizeof(fType));
}

bool PngChunk::IsType(const char* type) const
{
    return memcmp(fType, type, 4) == 0;
}

uint32 PngChunk::ComputedCRC() const
{
    return PngCRC::Chunk(fType, fData, fLength);
}

bool PngChunk::CRCValid() const
{
    return ComputedCRC() == fCRC;
}

PngChunkWalker::PngChunkWalker(const uint8* data, uint64 length)
    : m_Data(data), m_Length(length), m_Position(PNG_SIGNATURE_LEN),
      m_SawEnd(false), m_Done(false)
{
    if (m_Data == NULL)
        m_Length = 0;
}

PngChunkWalker::~PngChunkWalker(void)
{
}

bool PngChunkWalker::Next(PngChunk& chunk)
{
    if (m_Done)
        return false;

    if (m_Position > m_Length || m_Length - m_Position < PNG_CHUNK_OVERHEAD)
    {
        m_Done = true;
        return false;
    }

    const uint8* p = m_Data + m_Position;
    uint32 length = GetUint32BE(p);

    if ((uint64)length + PNG_CHUNK_OVERHEAD > m_Length - m_Position)
    {
        if (gPngCardVerbose)
        {
            fprintf(stderr, "Chunk at %llu: length %u overruns the buffer\n",
                    (unsigned long long)m_Position, length);
        }
        m_Done = true;
        return false;
    }

    chunk.fOffset = m_Position;
    chunk.fLength = length;
    memcpy(chunk.fType, p + 4, 4);
    chunk.fType[4] = 0;
    chunk.fData = p + 8;
    chunk.fCRC = GetUint32BE(p + 8 + length);

    m_Position += chunk.TotalSize();

    if (gPngCardVerbose)
    {
        fprintf(stderr, "Chunk: %s offset %llu length %u\n",
                chunk.fType, (unsigned long long)chunk.fOffset, chunk.fLength);
    }

    if (chunk.IsType("IEND"))
    {
        m_SawEnd = true;
        m_Done = true;
    }

    return true;
}
