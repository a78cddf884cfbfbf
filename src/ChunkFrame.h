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

#ifndef NODEPROG_CHUNKFRAME_H
#define NODEPROG_CHUNKFRAME_H

#include <stddef.h>
#include <vector>

// upload framing constants of the device side receiver
const unsigned char CHUNK_MARKER = 0x01;
const size_t UPLOAD_CHUNK_SIZE = 128;
const size_t CHUNK_FRAME_SIZE = 2 + UPLOAD_CHUNK_SIZE;
const unsigned char CHUNK_PADDING = ' ';

// upload chunk container: marker, length, payload, padded with spaces to a fixed size
class ChunkFrame
{
public:
    // zero length chunk, terminates the upload
    ChunkFrame();
    // chunk with up to UPLOAD_CHUNK_SIZE bytes of aData, starting at nOffs
    ChunkFrame(const std::vector<unsigned char> &aData, size_t nOffs);
    // frame as received, for decoding
    ChunkFrame(const unsigned char *aFrame, size_t nLen);

    const unsigned char *raw() const { return m_aFrame; }
    size_t size() const { return CHUNK_FRAME_SIZE; }
    bool valid() const { return m_bValid; }
    bool terminator() const { return m_bValid && (length() == 0); }
    size_t length() const { return m_aFrame[1]; }
    std::vector<unsigned char> payload() const;

private:
    void build(const unsigned char *pData, size_t nLen);

    bool m_bValid;
    unsigned char m_aFrame[CHUNK_FRAME_SIZE];
};

// number of data chunks needed for nLen bytes, terminator not included
inline size_t chunkCount(size_t nLen)
{
    return (nLen + UPLOAD_CHUNK_SIZE - 1) / UPLOAD_CHUNK_SIZE;
}

#endif // NODEPROG_CHUNKFRAME_H
