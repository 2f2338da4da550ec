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

#include "dng_types.h"

#define PNG_SIGNATURE_LEN       8
#define PNG_SIGNATURE_DATA      "\x89\x50\x4E\x47\x0D\x0A\x1A\x0A"

// length + type + crc
#define PNG_CHUNK_OVERHEAD      12

bool HasPngSignature(const uint8* data, uint64 length);

// One chunk of the stream. fData points into the walked buffer and is
// only valid as long as that buffer is.
//
// | length |  type  |    data     | crc(type+data) |
// |   4    |   4    | val(length) |       4        |
//
struct PngChunk
{
    PngChunk();

    uint64       fOffset;     // file offset of the length field
    uint32       fLength;     // payload byte count
    char         fType[5];    // NUL-terminated tag
    const uint8* fData;
    uint32       fCRC;        // as stored in the file

    bool IsType(const char* type) const;

    uint64 TotalSize() const { return (uint64)fLength + PNG_CHUNK_OVERHEAD; }

    // The whole chunk, length field through stored CRC.
    const uint8* Begin() const { return fData - 8; }

    uint32 ComputedCRC() const;
    bool CRCValid() const;
};

// Single pass over the chunks of a PNG buffer, starting right after the
// signature. The walk ends after IEND, or silently when the next chunk
// does not fit into the remaining bytes. To start over, make a new walker.
class PngChunkWalker
{
public:
    PngChunkWalker(const uint8* data, uint64 length);
    ~PngChunkWalker(void);

    bool Next(PngChunk& chunk);

    uint64 Position() const { return m_Position; }

    // Valid once Next() returned false.
    bool SawEnd() const { return m_SawEnd; }
    bool Truncated() const { return m_Done && !m_SawEnd; }

private:
    const uint8* m_Data;
    uint64       m_Length;
    uint64       m_Position;
    bool         m_SawEnd;
    bool         m_Done;
};
