/*
 *  NodeMCU file transfer utility
 *
 *  Copyright (c) 2026, the nodeprog authors
 *
 *  Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee
 *  is hereby granted, provided that the above copyright notice and this permission notice appear in all copies.
 *
 *  THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS
 *  SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 *  AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 *  WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT,
 *  NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR PERFORMANCE
 *  OF THIS SOFTWARE.
 */

#ifndef NODEPROG_OUTPUT_H
#define NODEPROG_OUTPUT_H

#include <ctype.h>
#include <string>
#include <iostream>
#include <iomanip>
#include <sstream>

// helper for outputing a zero padded hex number
struct OutputNum
{
    long m_nValue;
    int m_nWidth;
    OutputNum(long nValue, int nWidth) : m_nValue(nValue), m_nWidth(nWidth) {}
};
inline OutputNum outputHex2(int nValue)
{
    return OutputNum(nValue & 0xff, 2);
}
template<typename _CharT, typename _Traits> inline std::basic_ostream<_CharT, _Traits> &operator<<(std::basic_ostream<_CharT, _Traits> &oStream, OutputNum oVal)
{
    oStream << std::setfill('0') << std::setw(oVal.m_nWidth) << std::hex << oVal.m_nValue << std::dec << std::setw(0);
    return oStream;
}

// hex dump plus printable characters, used for debug traces of the serial traffic
inline std::string hexDump(const unsigned char *aData, size_t nNum)
{
    std::stringstream oData;
    for (size_t nByte = 0; nByte < nNum; nByte++)
        oData << outputHex2(aData[nByte]) << ' ';
    oData << '"';
    for (size_t nByte = 0; nByte < nNum; nByte++)
        oData << (isprint(aData[nByte])? (char)(aData[nByte]): '.');
    oData << '"';
    return oData.str();
}
inline std::string hexDump(const std::string &strData)
{
    return hexDump((const unsigned char *)strData.data(), strData.size());
}

// printable rendering of interpreter output, control characters escaped
inline std::string printable(const std::string &strData)
{
    std::stringstream oData;
    for (size_t nPos = 0; nPos < strData.size(); nPos++)
    {
        unsigned char nChar = strData[nPos];
        if (nChar == '\r')
            oData << "\\r";
        else if (nChar == '\n')
            oData << "\\n";
        else if (isprint(nChar))
            oData << (char)nChar;
        else
            oData << "\\x" << outputHex2(nChar);
    }
    return oData.str();
}

#endif // NODEPROG_OUTPUT_H
