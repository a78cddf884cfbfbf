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

#include "Response.h"

#include <ctype.h>
#include <stdlib.h>

static std::string trimRight(const std::string &strText)
{
    size_t nEnd = strText.size();
    while (nEnd > 0 && isspace((unsigned char)strText[nEnd - 1]))
        nEnd--;
    return strText.substr(0, nEnd);
}

bool parseDownloadResponse(const std::string &strResponse, size_t nChunkSize, size_t &nTotalSize, std::string &strPayload)
{
    size_t nEcho = strResponse.find('\n');
    if (nEcho == std::string::npos)
        return false;
    size_t nSize = strResponse.find('\n', nEcho + 1);
    if (nSize == std::string::npos)
        return false;

    // size line: decimal number, print() may leave a '\r' behind
    std::string strSize = trimRight(strResponse.substr(nEcho + 1, nSize - nEcho - 1));
    if (strSize.empty() || !isdigit((unsigned char)strSize[0]))
        return false;
    char *pEnd = 0;
    unsigned long nValue = strtoul(strSize.c_str(), &pEnd, 10);
    if (*pEnd != '\0')
        return false;

    nTotalSize = nValue;
    strPayload = strResponse.substr(nSize + 1, nChunkSize);
    return true;
}

std::vector<std::string> splitLines(const std::string &strResponse)
{
    std::vector<std::string> aLines;
    size_t nBeg = 0;
    while (nBeg < strResponse.size())
    {
        size_t nEnd = strResponse.find('\n', nBeg);
        if (nEnd == std::string::npos)
        {
            aLines.push_back(strResponse.substr(nBeg));
            break;
        }
        size_t nLen = nEnd - nBeg;
        if (nLen > 0 && strResponse[nEnd - 1] == '\r')
            nLen--;
        aLines.push_back(strResponse.substr(nBeg, nLen));
        nBeg = nEnd + 1;
    }
    return aLines;
}

bool responseLine(const std::string &strResponse, size_t nIndex, std::string &strLine)
{
    std::vector<std::string> aLines = splitLines(strResponse);
    if (nIndex >= aLines.size())
        return false;
    strLine = trimRight(aLines[nIndex]);
    return true;
}

bool commandFailed(const std::string &strResponse)
{
    // Lua reports errors of interactive input as "stdin:<line>: <message>"
    return (strResponse.find("stdin:") != std::string::npos) ||
        (strResponse.find("unexpected") != std::string::npos);
}

bool isSafeRemoteName(const std::string &strName)
{
    if (strName.empty())
        return false;
    for (size_t nPos = 0; nPos < strName.size(); nPos++)
    {
        char nChar = strName[nPos];
        if (nChar == '\'' || nChar == '"' || nChar == '\\' || nChar == '\0' || nChar == '\r' || nChar == '\n')
            return false;
    }
    return true;
}
