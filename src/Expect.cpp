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

#include "Expect.h"
#include "Output.h"

#include <time.h>
#include <iostream>

const char *const PROMPT = "> ";

long long monotonicUs()
{
    timespec oNow;
    clock_gettime(CLOCK_MONOTONIC, &oNow);
    return (long long)oNow.tv_sec * 1000000 + oNow.tv_nsec / 1000;
}

bool endsWith(const std::string &strData, const std::string &strTail)
{
    return (strData.size() >= strTail.size()) &&
        (strData.compare(strData.size() - strTail.size(), strTail.size(), strTail) == 0);
}

std::string expect(SerialLink &oLink, const std::string &strPattern, int nTimeoutMs, bool bDebug)
{
    long nOldTimeout = oLink.timeout();
    // checking for new data every 100us keeps the deadline precise
    oLink.setTimeout(EXPECT_POLL_US);

    long long nEnd = monotonicUs() + (long long)nTimeoutMs * 1000;
    std::string strData;
    while (!endsWith(strData, strPattern) && (monotonicUs() <= nEnd))
    {
        unsigned char nByte;
        int nRet = oLink.read(&nByte, 1);
        if (nRet < 0)
        {
            std::cerr << "expect: read failed after " << strData.size() << " bytes" << std::endl;
            break;
        }
        if (nRet > 0)
            strData += (char)nByte;
    }

    oLink.setTimeout(nOldTimeout);
    if (bDebug)
        std::cout << "expect \"" << printable(strPattern) << "\" returned \"" << printable(strData) << '"' << std::endl;
    return strData;
}
