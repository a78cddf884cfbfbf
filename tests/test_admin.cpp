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
#include <fstream>
#include <sstream>

#include "NodeSimulator.h"
#include "Session.h"
#include "Admin.h"

// receiver functions in the layout they are kept in, blanks and all
static const char *const RECEIVER_SCRIPT =
    "function recv_block(d)\r\n"
    "  if string.byte(d, 1) == 1 then\n"
    "    size = string.byte(d, 2)\n"
    "    uart.write(0, '\\006')\n"
    "  else\n"
    "    file.close() uart.setup(0, 9600, 8, 0, 1, 1)\n"
    "  end\n"
    "end\n"
    "\n"
    "function recv() uart.setup(0,9600,8,0,1,0) uart.on('data', '\\000', recv_name, 0) end\n";

class AdminTest : public ::testing::Test
{
protected:
    AdminTest() :
        m_oSession(m_oDevice, config()),
        m_oAdmin(m_oSession)
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
        m_oDevice.m_aFiles["init.lua"] = "print('hi')";
        m_oDevice.m_aFiles["data.txt"] = "0123456789";
    }

    NodeSimulator m_oDevice;
    Session m_oSession;
    Admin m_oAdmin;
};

TEST_F(AdminTest, FileList)
{
    std::string strResponse;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.fileList(strResponse));
    EXPECT_NE(std::string::npos, strResponse.find("init.lua\t11\r\n"));
    EXPECT_NE(std::string::npos, strResponse.find("data.txt\t10\r\n"));
    EXPECT_TRUE(endsWith(strResponse, PROMPT));
}

TEST_F(AdminTest, FileRemove)
{
    std::string strResponse;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.fileRemove("data.txt", strResponse));
    EXPECT_EQ((size_t)0, m_oDevice.m_aFiles.count("data.txt"));
    EXPECT_EQ("file.remove(\"data.txt\")", m_oDevice.m_aLines.back());
    EXPECT_EQ(RESULT_InvalidArgument, m_oAdmin.fileRemove("bad\"name", strResponse));
}

TEST_F(AdminTest, FileDo)
{
    std::string strResponse;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.fileDo("init.lua", strResponse));
    EXPECT_NE(std::string::npos, strResponse.find("hello from init.lua"));
    EXPECT_EQ(RESULT_CommandFailed, m_oAdmin.fileDo("missing.lua", strResponse));
    // the failure did not desync the session
    EXPECT_EQ(RESULT_Ok, m_oAdmin.fileDo("init.lua", strResponse));
}

TEST_F(AdminTest, FileCompile)
{
    std::string strResponse;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.fileCompile("init.lua", strResponse));
    EXPECT_EQ((size_t)1, m_oDevice.m_aFiles.count("init.lc"));
    EXPECT_EQ(RESULT_CommandFailed, m_oAdmin.fileCompile("missing.lua", strResponse));
}

TEST_F(AdminTest, FileFormat)
{
    std::string strResponse;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.fileFormat(strResponse));
    EXPECT_NE(std::string::npos, strResponse.find("format done"));

    m_oDevice.m_bFormatFails = true;
    EXPECT_EQ(RESULT_CommandFailed, m_oAdmin.fileFormat(strResponse));
}

TEST_F(AdminTest, NodeHeap)
{
    std::string strResponse;
    long nHeap = 0;
    m_oDevice.m_nHeap = 18872;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.nodeHeap(strResponse, nHeap));
    EXPECT_EQ(18872, nHeap);
}

TEST_F(AdminTest, NodeRestartLeavesSessionUnsynced)
{
    std::string strResponse;
    EXPECT_EQ(RESULT_Ok, m_oAdmin.nodeRestart(strResponse));
    EXPECT_TRUE(m_oDevice.m_bRestarted);
    EXPECT_NE(std::string::npos, strResponse.find("rst cause"));
    EXPECT_FALSE(m_oSession.synced());
}

TEST_F(AdminTest, NodeRestartWithoutAnyResponseTimesOut)
{
    std::string strResponse;
    m_oDevice.m_bSilent = true;
    EXPECT_EQ(RESULT_Timeout, m_oAdmin.nodeRestart(strResponse));
    EXPECT_EQ("", strResponse);
    EXPECT_FALSE(m_oSession.synced());
}

TEST_F(AdminTest, LateReplyIsNotTakenForTheNextCommand)
{
    std::string strResponse;
    m_oDevice.m_nReplyDelayUs = 500000;
    EXPECT_EQ(RESULT_Timeout, m_oAdmin.fileList(strResponse));
    EXPECT_FALSE(m_oSession.synced());

    // the listing is still on its way, nothing more is sent until the next sync
    long nHeap = 0;
    EXPECT_EQ(RESULT_SyncFailed, m_oAdmin.nodeHeap(strResponse, nHeap));
    EXPECT_EQ("", strResponse);
    EXPECT_EQ(RESULT_SyncFailed, m_oAdmin.fileRemove("data.txt", strResponse));
    EXPECT_EQ(RESULT_SyncFailed, m_oAdmin.prepare(RECEIVER_SCRIPT));
    EXPECT_EQ(RESULT_SyncFailed, m_oAdmin.nodeRestart(strResponse));
    ASSERT_EQ((size_t)1, m_oDevice.m_aLines.size());
    EXPECT_EQ("for key,value in pairs(file.list()) do print(key,value) end", m_oDevice.m_aLines[0]);
    EXPECT_EQ((size_t)1, m_oDevice.m_aFiles.count("data.txt"));
}

TEST_F(AdminTest, SilentDeviceTimesOut)
{
    std::string strResponse;
    m_oDevice.m_bSilent = true;
    EXPECT_EQ(RESULT_Timeout, m_oAdmin.fileList(strResponse));
    EXPECT_EQ("", strResponse);
    EXPECT_FALSE(m_oSession.synced());
}

TEST_F(AdminTest, ScriptLinesAreCompactedAndUseSessionBaud)
{
    std::vector<std::string> aLines = Admin::scriptLines(RECEIVER_SCRIPT, 115200);
    ASSERT_EQ((size_t)9, aLines.size());
    EXPECT_EQ("function recv_block(d)", aLines[0]);
    EXPECT_EQ("if string.byte(d,1) == 1 then", aLines[1]);
    EXPECT_EQ("size=string.byte(d,2)", aLines[2]);
    EXPECT_EQ("file.close() uart.setup(0,115200,8,0,1,1)", aLines[5]);
    EXPECT_EQ("function recv() uart.setup(0,115200,8,0,1,0) uart.on('data','\\000',recv_name,0) end", aLines[8]);
}

TEST_F(AdminTest, PrepareSendsReceiverScript)
{
    EXPECT_EQ(RESULT_Ok, m_oAdmin.prepare(RECEIVER_SCRIPT));
    std::vector<std::string> aExpected = Admin::scriptLines(RECEIVER_SCRIPT, 9600);
    EXPECT_EQ(aExpected, m_oDevice.m_aLines);
}

TEST_F(AdminTest, PrepareStopsAtInterpreterError)
{
    std::string strScript = std::string(RECEIVER_SCRIPT) + "syntax_error here\nprint(\"never\")\n";
    EXPECT_EQ(RESULT_CommandFailed, m_oAdmin.prepare(strScript));
    EXPECT_EQ("syntax_error here", m_oDevice.m_aLines.back());
}

TEST_F(AdminTest, ExecFileRunsEveryLine)
{
    std::stringstream oPath;
    oPath << "/tmp/nodeprog_test_" << getpid() << "_exec.lua";
    {
        std::ofstream oFile(oPath.str().c_str());
        oFile << "x = 1\r\nprint(\"one\")\n\nprint(\"two\")\n";
    }
    EXPECT_EQ(RESULT_Ok, m_oAdmin.execFile(oPath.str()));
    ASSERT_EQ((size_t)4, m_oDevice.m_aLines.size());
    EXPECT_EQ("x = 1", m_oDevice.m_aLines[0]);
    EXPECT_EQ("print(\"two\")", m_oDevice.m_aLines[3]);

    {
        std::ofstream oFile(oPath.str().c_str());
        oFile << "print(\"one\")\nsyntax_error\nprint(\"two\")\n";
    }
    m_oDevice.m_aLines.clear();
    EXPECT_EQ(RESULT_CommandFailed, m_oAdmin.execFile(oPath.str()));
    EXPECT_EQ((size_t)2, m_oDevice.m_aLines.size());

    remove(oPath.str().c_str());
    EXPECT_EQ(RESULT_FileError, m_oAdmin.execFile(oPath.str()));
}
