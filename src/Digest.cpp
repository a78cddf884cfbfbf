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

#include "Digest.h"
#include "Output.h"

#include <openssl/evp.h>
#include <sstream>
#include <iostream>

std::string sha1Hex(const std::vector<unsigned char> &aData)
{
    unsigned char aDigest[EVP_MAX_MD_SIZE];
    unsigned int nDigestLen = 0;
    if (!EVP_Digest(aData.empty()? (const unsigned char *)"": &aData[0], aData.size(), aDigest, &nDigestLen, EVP_sha1(), 0))
    {
        std::cerr << "EVP_Digest(sha1) failed" << std::endl;
        return "";
    }
    std::stringstream oHex;
    for (unsigned int nByte = 0; nByte < nDigestLen; nByte++)
        oHex << outputHex2(aDigest[nByte]);
    return oHex.str();
}
