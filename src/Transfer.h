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

#ifndef NODEPROG_TRANSFER_H
#define NODEPROG_TRANSFER_H

#include <stddef.h>
#include <string>
#include <vector>
#include "Session.h"
#include "ChunkFrame.h"

const size_t DOWNLOAD_CHUNK_SIZE = 256;
// the receiver waits for the destination name when it shows this prompt
extern const char *const READY_PROMPT;

// file transfer between host and device filesystem
class Transfer
{
public:
    explicit Transfer(Session &oSession);

    // Send aContent to the resident receiver, which stores it as strDestination.
    // Every 128 byte chunk is acknowledged, a zero length chunk ends the file.
    NodeResult upload(const std::vector<unsigned char> &aContent, const std::string &strDestination);
    // Read a remote file in 256 byte pieces, printed by the interpreter.
    NodeResult download(const std::string &strName, std::vector<unsigned char> &aContent);
    // check the remote file against the uploaded content
    NodeResult verify(const std::vector<unsigned char> &aContent, const std::string &strName, VerifyMode eMode);

    // upload a local file, strDestination defaults to the base name of strPath
    NodeResult writeFile(const std::string &strPath, const std::string &strDestination, VerifyMode eMode);
    // download a remote file, strDestination defaults to strName
    NodeResult readFile(const std::string &strName, const std::string &strDestination);

    static std::string downloadCommand(const std::string &strName, size_t nOffs, size_t nChunkSize);
    static std::string baseName(const std::string &strPath);

private:
    NodeResult writeChunk(const ChunkFrame &oFrame);
    NodeResult downloadChunk(const std::string &strName, size_t nOffs, size_t &nTotalSize, std::string &strPayload);

    Session &m_oSession;
};

bool readLocalFile(const std::string &strPath, std::vector<unsigned char> &aContent);
bool writeLocalFile(const std::string &strPath, const std::vector<unsigned char> &aContent);

#endif // NODEPROG_TRANSFER_H
