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

#include <gtest/gtest.h>

#include <unistd.h>
#include <stdio.h>
#include <sstream>

#include "NodeSimulator.h"
#include "Session.h"
#include "Transfer.h"
#include "Digest.h"

class TransferTest : public ::testing::Test
{
protected:
    TransferTest() :
        m_oSession(m_oDevice, config()),
        m_oTransfer(m_oSession)
    {
    }

    static NodeConfig config()
    {
        NodeConfig oConfig;
        oConfig.m_nTimeoutMs = 300;
        return oConfig;
    }

    virtual void SetUp()
    {
        ASSERT_EQ(RESULT_Ok, m_oSession.sync());
        m_oDevice.m_aLines.clear();
        m_oDevice.m_aWrites.clear();
        m_oDevice.m_strWritten.clear();
    }

    static std::vector<unsigned char> pattern(size_t nLen)
    {
        std::vector<unsigned char> aData(nLen);
        for (size_t nPos = 0; nPos < nLen; nPos++)
            aData[nPos] = (unsigned char)((nPos * 7 + 3) & 0xff);
        return aData;
    }

    static std::string tempPath(const char *szName)
    {
        std::stringstream oPath;
        oPath << "/tmp/nodeprog_test_" << getpid() << "_" << szName;
        return oPath.str();
    }

    void store(const std::string &strName, const std::vector<unsigned char> &aData)
    {
        m_oDevice.m_aFiles[strName] = std::string(aData.begin(), aData.end());
    }

    size_t downloadRounds() const
    {
        size_t nRounds = 0;
        for (size_t nLine = 0; nLine < m_oDevice.m_aLines.size(); nLine++)
            if (m_oDevice.m_aLines[nLine].compare(0, 10, "file.open(") == 0)
                nRounds++;
        return nRounds;
    }

    NodeSimulator m_oDevice;
    Session m_oSession;
    Transfer m_oTransfer;
};

TEST_F(TransferTest, UploadSendsAcknowledgedChunksAndTerminator)
{
    std::vector<unsigned char> aContent = pattern(300);
    EXPECT_EQ(RESULT_Ok, m_oTransfer.upload(aContent, "data.bin"));

    ASSERT_EQ((size_t)4, m_oDevice.m_aFrames.size());
    EXPECT_EQ((size_t)128, m_oDevice.m_aFrames[0].length());
    EXPECT_EQ((size_t)128, m_oDevice.m_aFrames[1].length());
    EXPECT_EQ((size_t)44, m_oDevice.m_aFrames[2].length());
    EXPECT_TRUE(m_oDevice.m_aFrames[3].terminator());

    // name plus four chunks, every acknowledge consumed
    EXPECT_EQ(5, m_oDevice.m_nAcks);
    EXPECT_EQ((size_t)0, m_oDevice.pending());

    ASSERT_EQ((size_t)6, m_oDevice.m_aWrites.size());
    EXPECT_EQ("recv()\n", m_oDevice.m_aWrites[0]);
    EXPECT_EQ(std::string("data.bin\0", 9), m_oDevice.m_aWrites[1]);
    for (size_t nWrite = 2; nWrite < 6; nWrite++)
        EXPECT_EQ(CHUNK_FRAME_SIZE, m_oDevice.m_aWrites[nWrite].size());

    EXPECT_EQ(std::string(aContent.begin(), aContent.end()), m_oDevice.m_aFiles["data.bin"]);
    EXPECT_EQ(NodeSimulator::MODE_Interpreter, m_oDevice.m_eMode);
}

TEST_F(TransferTest, UploadOfEmptyFileSendsOnlyTerminator)
{
    EXPECT_EQ(RESULT_Ok, m_oTransfer.upload(std::vector<unsigned char>(), "empty.txt"));
    ASSERT_EQ((size_t)1, m_oDevice.m_aFrames.size());
    EXPECT_TRUE(m_oDevice.m_aFrames[0].terminator());
    ASSERT_EQ((size_t)1, m_oDevice.m_aFiles.count("empty.txt"));
    EXPECT_EQ("", m_oDevice.m_aFiles["empty.txt"]);
}

TEST_F(TransferTest, UploadAbortsOnNack)
{
    m_oDevice.m_nNackAtChunk = 1;
    EXPECT_EQ(RESULT_NoAck, m_oTransfer.upload(pattern(1000), "big.bin"));
    // no retry and nothing after the rejected chunk
    EXPECT_EQ((size_t)2, m_oDevice.m_aFrames.size());
    EXPECT_EQ((size_t)0, m_oDevice.m_aFiles.count("big.bin"));
    EXPECT_FALSE(m_oSession.synced());
}

TEST_F(TransferTest, UploadWithoutReceiverFails)
{
    m_oDevice.m_bNoReceiver = true;
    EXPECT_EQ(RESULT_CommandFailed, m_oTransfer.upload(pattern(10), "x.bin"));
    ASSERT_EQ((size_t)1, m_oDevice.m_aWrites.size());
    EXPECT_EQ("recv()\n", m_oDevice.m_aWrites[0]);
}

TEST_F(TransferTest, UploadWithSilentReceiverLeavesSessionUnsynced)
{
    m_oDevice.m_bSilent = true;
    EXPECT_EQ(RESULT_Timeout, m_oTransfer.upload(pattern(10), "x.bin"));
    EXPECT_FALSE(m_oSession.synced());
}

TEST_F(TransferTest, DownloadTimeoutBlocksFurtherTransfers)
{
    std::vector<unsigned char> aContent = pattern(100);
    store("slow.bin", aContent);
    m_oDevice.m_nReplyDelayUs = 500000;

    std::vector<unsigned char> aResult;
    EXPECT_EQ(RESULT_Timeout, m_oTransfer.download("slow.bin", aResult));
    EXPECT_FALSE(m_oSession.synced());

    // the delayed chunk must not be read as the answer to any of these
    EXPECT_EQ(RESULT_SyncFailed, m_oTransfer.download("slow.bin", aResult));
    EXPECT_EQ(RESULT_SyncFailed, m_oTransfer.upload(aContent, "other.bin"));
    EXPECT_EQ(RESULT_SyncFailed, m_oTransfer.verify(aContent, "slow.bin", VERIFY_Sha1));
    EXPECT_EQ(RESULT_SyncFailed, m_oTransfer.verify(aContent, "slow.bin", VERIFY_Standard));
    EXPECT_EQ((size_t)1, m_oDevice.m_aWrites.size());
    EXPECT_TRUE(aResult.empty());
}

TEST_F(TransferTest, UploadRejectsUnsafeNames)
{
    EXPECT_EQ(RESULT_InvalidArgument, m_oTransfer.upload(pattern(10), "it's.lua"));
    EXPECT_EQ(RESULT_InvalidArgument, m_oTransfer.upload(pattern(10), ""));
    EXPECT_TRUE(m_oDevice.m_aWrites.empty());
}

TEST_F(TransferTest, DownloadReadsAllChunks)
{
    std::vector<unsigned char> aContent = pattern(600);
    store("log.txt", aContent);

    std::vector<unsigned char> aResult;
    EXPECT_EQ(RESULT_Ok, m_oTransfer.download("log.txt", aResult));
    EXPECT_EQ(aContent, aResult);
    EXPECT_EQ((size_t)3, downloadRounds());
    EXPECT_EQ(Transfer::downloadCommand("log.txt", 512, 256), m_oDevice.m_aLines.back());
}

TEST_F(TransferTest, DownloadOfExactChunkMultipleAsksOnceMore)
{
    std::vector<unsigned char> aContent = pattern(256);
    store("a.bin", aContent);

    std::vector<unsigned char> aResult;
    EXPECT_EQ(RESULT_Ok, m_oTransfer.download("a.bin", aResult));
    EXPECT_EQ(aContent, aResult);
    EXPECT_EQ((size_t)2, downloadRounds());
}

TEST_F(TransferTest, DownloadOfEmptyFile)
{
    store("empty", std::vector<unsigned char>());
    std::vector<unsigned char> aResult(3, 'x');
    EXPECT_EQ(RESULT_Ok, m_oTransfer.download("empty", aResult));
    EXPECT_TRUE(aResult.empty());
    EXPECT_EQ((size_t)1, downloadRounds());
}

TEST_F(TransferTest, DownloadCopesWithPromptInsidePayload)
{
    std::string strText = "x> y> ";
    strText += std::string(248, 'a');
    strText += "> ";                        // chunk ends in prompt characters
    strText += "tail> ";
    std::vector<unsigned char> aContent(strText.begin(), strText.end());
    store("prompt.txt", aContent);

    std::vector<unsigned char> aResult;
    EXPECT_EQ(RESULT_Ok, m_oTransfer.download("prompt.txt", aResult));
    EXPECT_EQ(aContent, aResult);
    EXPECT_EQ((size_t)0, m_oDevice.pending());
}

TEST_F(TransferTest, DownloadOfMissingFileIsParseError)
{
    std::vector<unsigned char> aResult;
    EXPECT_EQ(RESULT_ParseError, m_oTransfer.download("missing.txt", aResult));
    EXPECT_TRUE(aResult.empty());
}

TEST_F(TransferTest, StandardVerification)
{
    std::vector<unsigned char> aContent = pattern(400);
    ASSERT_EQ(RESULT_Ok, m_oTransfer.upload(aContent, "v.bin"));
    EXPECT_EQ(RESULT_Ok, m_oTransfer.verify(aContent, "v.bin", VERIFY_Standard));
    EXPECT_EQ(RESULT_Ok, m_oTransfer.verify(aContent, "v.bin", VERIFY_None));

    m_oDevice.m_bCorruptStore = true;
    ASSERT_EQ(RESULT_Ok, m_oTransfer.upload(aContent, "w.bin"));
    EXPECT_EQ(RESULT_VerifyMismatch, m_oTransfer.verify(aContent, "w.bin", VERIFY_Standard));
}

TEST_F(TransferTest, Sha1Verification)
{
    std::vector<unsigned char> aContent = pattern(200);
    ASSERT_EQ(RESULT_Ok, m_oTransfer.upload(aContent, "s.bin"));
    EXPECT_EQ(RESULT_Ok, m_oTransfer.verify(aContent, "s.bin", VERIFY_Sha1));
    EXPECT_EQ("shafile(\"s.bin\")", m_oDevice.m_aLines.back());

    // one differing hex digit
    std::string strDigest = sha1Hex(aContent);
    strDigest[17] = (strDigest[17] == '0')? '1': '0';
    m_oDevice.m_strShaOverride = strDigest;
    EXPECT_EQ(RESULT_VerifyMismatch, m_oTransfer.verify(aContent, "s.bin", VERIFY_Sha1));

    m_oDevice.m_strShaOverride = "";
    EXPECT_EQ(RESULT_CommandFailed, m_oTransfer.verify(aContent, "nothere.bin", VERIFY_Sha1));
}

TEST_F(TransferTest, WriteAndReadLocalFiles)
{
    std::string strLocal = tempPath("init.lua");
    std::string strBack = tempPath("back.lua");
    std::vector<unsigned char> aContent = pattern(333);
    ASSERT_TRUE(writeLocalFile(strLocal, aContent));

    EXPECT_EQ(RESULT_Ok, m_oTransfer.writeFile(strLocal, "", VERIFY_Sha1));
    std::string strRemote = Transfer::baseName(strLocal);
    ASSERT_EQ((size_t)1, m_oDevice.m_aFiles.count(strRemote));

    EXPECT_EQ(RESULT_Ok, m_oTransfer.readFile(strRemote, strBack));
    std::vector<unsigned char> aBack;
    ASSERT_TRUE(readLocalFile(strBack, aBack));
    EXPECT_EQ(aContent, aBack);

    EXPECT_EQ(RESULT_FileError, m_oTransfer.writeFile(tempPath("does-not-exist"), "x", VERIFY_None));
    remove(strLocal.c_str());
    remove(strBack.c_str());
}

TEST(TransferSession, CloseAfterRejectedUploadRestoresDefaultBaud)
{
    NodeSimulator oDevice;
    NodeConfig oConfig;
    oConfig.m_nTimeoutMs = 300;
    oConfig.m_nBaud = 115200;
    Session oSession(oDevice, oConfig);
    ASSERT_EQ(RESULT_Ok, oSession.sync());
    ASSERT_EQ(115200, oDevice.m_nDeviceBaud);

    oDevice.m_nNackAtChunk = 0;
    Transfer oTransfer(oSession);
    EXPECT_EQ(RESULT_NoAck, oTransfer.upload(std::vector<unsigned char>(200, 'x'), "x.bin"));
    EXPECT_FALSE(oSession.synced());

    oSession.close();
    EXPECT_TRUE(oDevice.m_bClosed);
    EXPECT_EQ("uart.setup(0,9600,8,0,1,1)", oDevice.m_aLines.back());
    EXPECT_EQ(9600, oDevice.m_nDeviceBaud);
}

TEST(TransferNames, BaseName)
{
    EXPECT_EQ("init.lua", Transfer::baseName("/home/user/init.lua"));
    EXPECT_EQ("init.lua", Transfer::baseName("init.lua"));
    EXPECT_EQ("", Transfer::baseName("dir/"));
}
