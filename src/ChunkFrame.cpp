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

#include "ChunkFrame.h"

#include <string.h>

ChunkFrame::ChunkFrame() :
    m_bValid(true)
{
    build(0, 0);
}

ChunkFrame::ChunkFrame(const std::vector<unsigned char> &aData, size_t nOffs) :
    m_bValid(true)
{
    size_t nLen = (nOffs < aData.size())? aData.size() - nOffs: 0;
    if (nLen > UPLOAD_CHUNK_SIZE)
        nLen = UPLOAD_CHUNK_SIZE;
    build(nLen? &aData[nOffs]: 0, nLen);
}

ChunkFrame::ChunkFrame(const unsigned char *aFrame, size_t nLen) :
    m_bValid(false)
{
    memset(m_aFrame, 0, sizeof(m_aFrame));
    if (nLen != CHUNK_FRAME_SIZE)
        return;
    memcpy(m_aFrame, aFrame, CHUNK_FRAME_SIZE);
    m_bValid = (m_aFrame[0] == CHUNK_MARKER) && (m_aFrame[1] <= UPLOAD_CHUNK_SIZE);
}

void ChunkFrame::build(const unsigned char *pData, size_t nLen)
{
    m_aFrame[0] = CHUNK_MARKER;
    m_aFrame[1] = (unsigned char)nLen;
    if (nLen)
        memcpy(m_aFrame + 2, pData, nLen);
    // the receiver reads fixed size blocks, the length byte tells the real size
    memset(m_aFrame + 2 + nLen, CHUNK_PADDING, UPLOAD_CHUNK_SIZE - nLen);
}

std::vector<unsigned char> ChunkFrame::payload() const
{
    if (!m_bValid)
        return std::vector<unsigned char>();
    return std::vector<unsigned char>(m_aFrame + 2, m_aFrame + 2 + length());
}
