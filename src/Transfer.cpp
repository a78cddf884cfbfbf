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

#include "Transfer.h"
#include "Expect.h"
#include "Response.h"
#include "Digest.h"
#include "Output.h"

#include <string.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <iostream>

const char *const READY_PROMPT = "C> ";

bool readLocalFile(const std::string &strPath, std::vector<unsigned char> &aContent)
{
    std::ifstream oFile(strPath.c_str(), std::ifstream::in | std::ifstream::binary);
    if (!oFile.is_open())
    {
        std::cerr << "failed to open " << strPath << std::endl;
        return false;
    }
    aContent.assign(std::istreambuf_iterator<char>(oFile), std::istreambuf_iterator<char>());
    if (oFile.bad())
    {
        std::cerr << "failed to read " << strPath << std::endl;
        return false;
    }
    return true;
}

bool writeLocalFile(const std::string &strPath, const std::vector<unsigned char> &aContent)
{
    std::ofstream oFile(strPath.c_str(), std::ofstream::out | std::ofstream::binary | std::ofstream::trunc);
    if (!oFile.is_open())
    {
        std::cerr << "failed to create " << strPath << std::endl;
        return false;
    }
    if (!aContent.empty())
        oFile.write((const char *)&aContent[0], aContent.size());
    oFile.close();
    if (oFile.fail())
    {
        std::cerr << "failed to write " << strPath << std::endl;
        return false;
    }
    return true;
}

Transfer::Transfer(Session &oSession) :
    m_oSession(oSession)
{
}

std::string Transfer::baseName(const std::string &strPath)
{
    size_t nSlash = strPath.find_last_of('/');
    return (nSlash == std::string::npos)? strPath: strPath.substr(nSlash + 1);
}

std::string Transfer::downloadCommand(const std::string &strName, size_t nOffs, size_t nChunkSize)
{
    std::stringstream oCmd;
    oCmd << "file.open('" << strName << "') print(file.seek('end', 0)) file.seek('set', " << nOffs << ") "
        << "uart.write(0, file.read(" << nChunkSize << "))file.close()";
    return oCmd.str();
}

NodeResult Transfer::writeChunk(const ChunkFrame &oFrame)
{
    if (m_oSession.debug())
        std::cout << "writing " << oFrame.length() << " bytes chunk" << std::endl;
    if (!m_oSession.write(std::string((const char *)oFrame.raw(), oFrame.size())))
        return RESULT_IoError;
    if (!m_oSession.readAck())
        return RESULT_NoAck;
    return RESULT_Ok;
}

NodeResult Transfer::upload(const std::vector<unsigned char> &aContent, const std::string &strDestination)
{
    if (!isSafeRemoteName(strDestination))
    {
        std::cerr << "invalid remote file name \"" << printable(strDestination) << '"' << std::endl;
        return RESULT_InvalidArgument;
    }
    if (!m_oSession.checkSynced("upload"))
        return RESULT_SyncFailed;

    if (!m_oSession.writeln("recv()"))
        return RESULT_IoError;
    std::string strRes = m_oSession.expect(READY_PROMPT);
    if (!endsWith(strRes, READY_PROMPT))
    {
        std::cerr << "error waiting for receiver \"" << printable(strRes) << '"' << std::endl;
        if (!endsWith(strRes, PROMPT))
            m_oSession.markUnsynced();
        return commandFailed(strRes)? RESULT_CommandFailed: RESULT_Timeout;
    }

    if (m_oSession.debug())
        std::cout << "sending destination filename \"" << strDestination << '"' << std::endl;
    if (!m_oSession.write(strDestination + std::string(1, '\0')))
        return RESULT_IoError;
    if (!m_oSession.readAck())
    {
        std::cerr << "did not ack destination filename" << std::endl;
        m_oSession.markUnsynced();
        return RESULT_NoAck;
    }

    std::cout << "sending " << aContent.size() << " bytes in " << chunkCount(aContent.size()) << " chunks ..." << std::endl;
    for (size_t nOffs = 0; nOffs < aContent.size(); nOffs += UPLOAD_CHUNK_SIZE)
    {
        NodeResult eResult = writeChunk(ChunkFrame(aContent, nOffs));
        if (eResult != RESULT_Ok)
        {
            // collect whatever the receiver complained about
            std::string strData = m_oSession.expect();
            std::cerr << "bad chunk response at offset " << nOffs << ": \"" << printable(strData) << "\" " << hexDump(strData) << std::endl;
            m_oSession.markUnsynced();
            return eResult;
        }
    }

    if (m_oSession.debug())
        std::cout << "sending zero block" << std::endl;
    NodeResult eResult = writeChunk(ChunkFrame());
    if (eResult != RESULT_Ok)
    {
        std::cerr << "end of file not acknowledged" << std::endl;
        m_oSession.markUnsynced();
        return eResult;
    }
    std::cout << " ... done." << std::endl;
    return RESULT_Ok;
}

NodeResult Transfer::downloadChunk(const std::string &strName, size_t nOffs, size_t &nTotalSize, std::string &strPayload)
{
    std::string strResponse = m_oSession.exchange(downloadCommand(strName, nOffs, DOWNLOAD_CHUNK_SIZE));

    // raw payload may contain the prompt sequence itself: keep reading until
    // the payload is complete and followed by a prompt
    std::string strRest;
    while (endsWith(strResponse, PROMPT) && parseDownloadResponse(strResponse, std::string::npos, nTotalSize, strRest))
    {
        size_t nWant = (nOffs < nTotalSize)? std::min(DOWNLOAD_CHUNK_SIZE, nTotalSize - nOffs): 0;
        if (strRest.size() >= nWant + strlen(PROMPT))
            break;
        std::string strMore = m_oSession.expect();
        if (strMore.empty())
        {
            // the rest of the payload may still arrive
            m_oSession.markUnsynced();
            break;
        }
        strResponse += strMore;
    }

    if (!endsWith(strResponse, PROMPT))
    {
        std::cerr << "no prompt after reading " << strName << " at offset " << nOffs << ": \"" << printable(strResponse) << '"' << std::endl;
        return RESULT_Timeout;
    }
    if (!parseDownloadResponse(strResponse, DOWNLOAD_CHUNK_SIZE, nTotalSize, strPayload))
    {
        std::cerr << "unexpected response reading " << strName << ": \"" << printable(strResponse) << '"' << std::endl;
        return RESULT_ParseError;
    }
    return RESULT_Ok;
}

NodeResult Transfer::download(const std::string &strName, std::vector<unsigned char> &aContent)
{
    aContent.clear();
    if (!isSafeRemoteName(strName))
    {
        std::cerr << "invalid remote file name \"" << printable(strName) << '"' << std::endl;
        return RESULT_InvalidArgument;
    }
    if (!m_oSession.checkSynced("download"))
        return RESULT_SyncFailed;

    std::string strData;
    size_t nTotalSize = 0;
    size_t nBytesRead = 0;
    while (true)
    {
        std::string strPayload;
        NodeResult eResult = downloadChunk(strName, nBytesRead, nTotalSize, strPayload);
        if (eResult != RESULT_Ok)
            return eResult;
        strData += strPayload;
        nBytesRead += DOWNLOAD_CHUNK_SIZE;
        if (nBytesRead > nTotalSize)
            break;
    }

    if (strData.size() < nTotalSize)
    {
        std::cerr << "short read of " << strName << ": " << strData.size() << " of " << nTotalSize << " bytes" << std::endl;
        return RESULT_ParseError;
    }
    strData.resize(nTotalSize);
    aContent.assign(strData.begin(), strData.end());
    return RESULT_Ok;
}

NodeResult Transfer::verify(const std::vector<unsigned char> &aContent, const std::string &strName, VerifyMode eMode)
{
    if (eMode == VERIFY_Standard)
    {
        std::cout << "verifying ..." << std::endl;
        std::vector<unsigned char> aRemote;
        NodeResult eResult = download(strName, aRemote);
        if (eResult != RESULT_Ok)
            return eResult;
        if (aRemote != aContent)
        {
            std::cerr << "verification failed: " << strName << " differs from uploaded content" << std::endl;
            return RESULT_VerifyMismatch;
        }
        std::cout << " ... match." << std::endl;
    }
    else if (eMode == VERIFY_Sha1)
    {
        if (!m_oSession.checkSynced("verify"))
            return RESULT_SyncFailed;
        std::cout << "verifying sha1 ..." << std::endl;
        std::string strResponse = m_oSession.exchange("shafile(\"" + strName + "\")");
        if (!endsWith(strResponse, PROMPT))
            return RESULT_Timeout;
        if (commandFailed(strResponse))
        {
            std::cerr << "shafile failed: \"" << printable(strResponse) << '"' << std::endl;
            return RESULT_CommandFailed;
        }
        // first line is the command echo
        std::string strRemote;
        if (!responseLine(strResponse, 1, strRemote))
        {
            std::cerr << "no digest in response \"" << printable(strResponse) << '"' << std::endl;
            return RESULT_ParseError;
        }
        std::string strLocal = sha1Hex(aContent);
        std::cout << "remote sha1: " << strRemote << std::endl;
        std::cout << "local sha1:  " << strLocal << std::endl;
        if (strRemote != strLocal)
        {
            std::cerr << "verification failed: sha1 mismatch" << std::endl;
            return RESULT_VerifyMismatch;
        }
        std::cout << " ... match." << std::endl;
    }
    return RESULT_Ok;
}

NodeResult Transfer::writeFile(const std::string &strPath, const std::string &strDestination, VerifyMode eMode)
{
    std::string strName = strDestination.empty()? baseName(strPath): strDestination;
    std::cout << "transferring " << strPath << " as " << strName << std::endl;

    std::vector<unsigned char> aContent;
    if (!readLocalFile(strPath, aContent))
        return RESULT_FileError;
    NodeResult eResult = upload(aContent, strName);
    if (eResult != RESULT_Ok)
        return eResult;
    return verify(aContent, strName, eMode);
}

NodeResult Transfer::readFile(const std::string &strName, const std::string &strDestination)
{
    std::string strPath = strDestination.empty()? strName: strDestination;
    std::cout << "transferring " << strName << " to " << strPath << std::endl;

    std::vector<unsigned char> aContent;
    NodeResult eResult = download(strName, aContent);
    if (eResult != RESULT_Ok)
        return eResult;
    if (!writeLocalFile(strPath, aContent))
        return RESULT_FileError;
    std::cout << " ... " << aContent.size() << " bytes." << std::endl;
    return RESULT_Ok;
}
