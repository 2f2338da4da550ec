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

#include <stddef.h>
#include <string>

enum pngcard_error_code
{
    pngcard_error_none          = 0,
    pngcard_error_not_a_png     = 200000,   // missing or wrong 8-byte signature
    pngcard_error_truncated_png,            // no IEND to insert before, or a chunk overruns the buffer
    pngcard_error_decode                    // card text is not valid base64 or not valid UTF-8
};

class PngCardException
{
public:
    PngCardException(pngcard_error_code code, const char* subMessage = NULL);
    virtual ~PngCardException(void);

    pngcard_error_code ErrorCode() const { return m_ErrorCode; }

    // Detail given at the throw site, empty if none.
    const std::string& SubMessage() const { return m_SubMessage; }

private:
    pngcard_error_code m_ErrorCode;
    std::string m_SubMessage;
};

const char* LookupPngCardError(pngcard_error_code code);

void ReportPngCardError(const char* message, const char* subMessage = NULL);

void ThrowNotAPng(const char* subMessage = NULL);
void ThrowTruncatedPng(const char* subMessage = NULL);
void ThrowCardDecodeError(const char* subMessage = NULL);
