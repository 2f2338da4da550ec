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

#include "pngcardexceptions.h"
#include "pngcardglobals.h"

#include <stdio.h>

PngCardException::PngCardException(pngcard_error_code code, const char* subMessage)
    : m_ErrorCode(code), m_SubMessage(subMessage ? subMessage : "")
{
}

PngCardException::~PngCardException(void)
{
}

const char* LookupPngCardError(pngcard_error_code code)
{
    switch (code)
    {
    case pngcard_error_none:
        return "no error";
    case pngcard_error_not_a_png:
        return "not a PNG file";
    case pngcard_error_truncated_png:
        return "truncated PNG file";
    case pngcard_error_decode:
        return "card text cannot be decoded";
    }

    return "unknown error";
}

void ReportPngCardError(const char* message, const char* subMessage)
{
    if (!gPngCardVerbose)
        return;

    if (subMessage && subMessage[0])
        fprintf(stderr, "*** pngcard error: %s (%s) ***\n", message, subMessage);
    else
        fprintf(stderr, "*** pngcard error: %s ***\n", message);
}

static void Throw(pngcard_error_code code, const char* subMessage)
{
    ReportPngCardError(LookupPngCardError(code), subMessage);
    throw PngCardException(code, subMessage);
}

void ThrowNotAPng(const char* subMessage)
{
    Throw(pngcard_error_not_a_png, subMessage);
}

void ThrowTruncatedPng(const char* subMessage)
{
    Throw(pngcard_error_truncated_png, subMessage);
}

void ThrowCardDecodeError(const char* subMessage)
{
    Throw(pngcard_error_decode, subMessage);
}
