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

#include <stdlib.h>
#include <string>
#include <vector>
#include <iostream>
#include <fstream>
#include <iterator>

#include "SerialPort.h"
#include "Session.h"
#include "Transfer.h"
#include "Admin.h"
#include "Expect.h"

// split "<first>:<second>", second is empty if there is no colon
static void splitPair(const std::string &strArg, std::string &strFirst, std::string &strSecond)
{
    size_t nColon = strArg.find(':');
    strFirst = strArg.substr(0, nColon);
    strSecond = (nColon == std::string::npos)? "": strArg.substr(nColon + 1);
}

static void showUsage(const char *szProgram)
{
    std::cout << "usage:" << std::endl;
    std::cout << "    " << szProgram << " [options] upload <local file>[:<remote file>] ..." << std::endl;
    std::cout << "    " << szProgram << " [options] download <remote file>[:<local file>] ..." << std::endl;
    std::cout << "    " << szProgram << " [options] exec <local lua file> ..." << std::endl;
    std::cout << "    " << szProgram << " [options] file list|format" << std::endl;
    std::cout << "    " << szProgram << " [options] file remove|do|compile <remote file> ..." << std::endl;
    std::cout << "    " << szProgram << " [options] node heap|restart" << std::endl;
    std::cout << "options:" << std::endl;
    std::cout << "    -P, --port <serial port>" << std::endl;
    std::cout << "        serial port the device is connected to" << std::endl;
    std::cout << "        default: " << defaultPort() << std::endl;
    std::cout << "    -b, --baud <baud rate>" << std::endl;
    std::cout << "        switch device and host to this baud rate after sync" << std::endl;
    std::cout << "        default: " << DEFAULT_BAUD << std::endl;
    std::cout << "    -t, --timeout <milliseconds>" << std::endl;
    std::cout << "        time to wait for the interpreter prompt" << std::endl;
    std::cout << "        default: 5000" << std::endl;
    std::cout << "    -r, --receiver <lua file>" << std::endl;
    std::cout << "        upload the receiver functions (recv, shafile) before the command" << std::endl;
    std::cout << "    -v, --verify none|standard|sha1" << std::endl;
    std::cout << "        check uploaded files by reading them back or by comparing SHA-1 digests" << std::endl;
    std::cout << "        default: none" << std::endl;
    std::cout << "    -c, --compile" << std::endl;
    std::cout << "        compile uploaded .lua files and remove the sources" << std::endl;
    std::cout << "    -R, --restart" << std::endl;
    std::cout << "        restart the device when done" << std::endl;
    std::cout << "    --no-resync" << std::endl;
    std::cout << "        skip the sync marker check after changing the baud rate" << std::endl;
    std::cout << "    -d, --debug" << std::endl;
    std::cout << "        print sent/received data on standard out for debugging communication" << std::endl;
    std::cout << "        default: false" << std::endl;
    std::cout << "examples:" << std::endl;
    std::cout << "    upload init.lua with receiver preparation and SHA-1 check at 115200 baud:" << std::endl;
    std::cout << "        " << szProgram << " -b 115200 -r receiver.lua -v sha1 upload init.lua" << std::endl;
    std::cout << "    fetch a data file under a different local name:" << std::endl;
    std::cout << "        " << szProgram << " download log.txt:/tmp/node-log.txt" << std::endl;
    std::cout << std::endl;
}

static NodeResult runCommand(Session &oSession, const std::vector<std::string> &aArgs, VerifyMode eVerify, bool bCompile)
{
    Transfer oTransfer(oSession);
    Admin oAdmin(oSession);
    std::string strCommand = aArgs[0];
    std::string strResponse;
    NodeResult eResult = RESULT_Ok;

    if (strCommand == "upload")
    {
        for (size_t nArg = 1; (nArg < aArgs.size()) && (eResult == RESULT_Ok); nArg++)
        {
            std::string strLocal, strRemote;
            splitPair(aArgs[nArg], strLocal, strRemote);
            if (strRemote.empty())
                strRemote = Transfer::baseName(strLocal);
            eResult = oTransfer.writeFile(strLocal, strRemote, eVerify);
            if ((eResult == RESULT_Ok) && bCompile && endsWith(strRemote, ".lua"))
            {
                eResult = oAdmin.fileCompile(strRemote, strResponse);
                if (eResult == RESULT_Ok)
                    eResult = oAdmin.fileRemove(strRemote, strResponse);
            }
        }
    }
    else if (strCommand == "download")
    {
        for (size_t nArg = 1; (nArg < aArgs.size()) && (eResult == RESULT_Ok); nArg++)
        {
            std::string strRemote, strLocal;
            splitPair(aArgs[nArg], strRemote, strLocal);
            eResult = oTransfer.readFile(strRemote, strLocal);
        }
    }
    else if (strCommand == "exec")
    {
        for (size_t nArg = 1; (nArg < aArgs.size()) && (eResult == RESULT_Ok); nArg++)
            eResult = oAdmin.execFile(aArgs[nArg]);
    }
    else if ((strCommand == "file") && (aArgs.size() >= 2))
    {
        std::string strAction = aArgs[1];
        if (strAction == "list")
            eResult = oAdmin.fileList(strResponse);
        else if (strAction == "format")
            eResult = oAdmin.fileFormat(strResponse);
        else if ((strAction == "remove") || (strAction == "do") || (strAction == "compile"))
        {
            for (size_t nArg = 2; (nArg < aArgs.size()) && (eResult == RESULT_Ok); nArg++)
            {
                if (strAction == "remove")
                    eResult = oAdmin.fileRemove(aArgs[nArg], strResponse);
                else if (strAction == "do")
                    eResult = oAdmin.fileDo(aArgs[nArg], strResponse);
                else
                    eResult = oAdmin.fileCompile(aArgs[nArg], strResponse);
            }
        }
        else
            eResult = RESULT_InvalidArgument;
    }
    else if ((strCommand == "node") && (aArgs.size() == 2))
    {
        if (aArgs[1] == "heap")
        {
            long nHeap = 0;
            eResult = oAdmin.nodeHeap(strResponse, nHeap);
            if (eResult == RESULT_Ok)
                std::cout << "heap: " << nHeap << " bytes" << std::endl;
        }
        else if (aArgs[1] == "restart")
            eResult = oAdmin.nodeRestart(strResponse);
        else
            eResult = RESULT_InvalidArgument;
    }
    else
        eResult = RESULT_InvalidArgument;
    return eResult;
}

int main(int argc, char *argv[])
{
    // parse commandline arguments
    bool bShowUsage = false;
    NodeConfig oConfig;
    oConfig.m_strPort = defaultPort();
    const char *szReceiver = 0;
    bool bCompile = false;
    bool bRestart = false;
    std::vector<std::string> aArgs;
    for (int nArg = 1; nArg < argc; nArg++)
    {
        std::string strArg = argv[nArg];
        if ((strArg == "-?") || (strArg == "-h") || (strArg == "--help"))
            bShowUsage = true;
        else if ((strArg == "-P") || (strArg == "--port"))
        {
            nArg += 1;
            if (nArg < argc)
                oConfig.m_strPort = argv[nArg];
            else
                bShowUsage = true;
        }
        else if ((strArg == "-b") || (strArg == "--baud"))
        {
            nArg += 1;
            if (nArg < argc)
                oConfig.m_nBaud = atoi(argv[nArg]);
            if ((nArg >= argc) || (SerialPort::speedFor(oConfig.m_nBaud) == B0))
                bShowUsage = true;
        }
        else if ((strArg == "-t") || (strArg == "--timeout"))
        {
            nArg += 1;
            if (nArg < argc)
                oConfig.m_nTimeoutMs = atoi(argv[nArg]);
            if ((nArg >= argc) || (oConfig.m_nTimeoutMs <= 0))
                bShowUsage = true;
        }
        else if ((strArg == "-r") || (strArg == "--receiver"))
        {
            nArg += 1;
            if (nArg < argc)
                szReceiver = argv[nArg];
            else
                bShowUsage = true;
        }
        else if ((strArg == "-v") || (strArg == "--verify"))
        {
            nArg += 1;
            if ((nArg >= argc) || !parseVerifyMode(argv[nArg], oConfig.m_eVerify))
                bShowUsage = true;
        }
        else if ((strArg == "-c") || (strArg == "--compile"))
            bCompile = true;
        else if ((strArg == "-R") || (strArg == "--restart"))
            bRestart = true;
        else if (strArg == "--no-resync")
            oConfig.m_bResyncAfterBaud = false;
        else if ((strArg == "-d") || (strArg == "--debug"))
            oConfig.m_bDebug = true;
        else if ((strArg.size() > 1) && (strArg[0] == '-'))
            bShowUsage = true;
        else
            aArgs.push_back(strArg);
    }
    if (bShowUsage || aArgs.empty())
    {
        showUsage(argv[0]);
        return 0;
    }

    std::string strReceiver;
    if (szReceiver)
    {
        std::ifstream oFile(szReceiver, std::ifstream::in | std::ifstream::binary);
        if (!oFile.is_open())
        {
            std::cerr << "failed to open receiver script " << szReceiver << std::endl;
            return -1;
        }
        strReceiver.assign(std::istreambuf_iterator<char>(oFile), std::istreambuf_iterator<char>());
    }

    // open target device, the interpreter starts at the default baud rate
    SerialPort oPort(oConfig.m_bDebug);
    if (!oPort.open(oConfig.m_strPort.c_str(), DEFAULT_BAUD, (long)oConfig.m_nTimeoutMs * 1000))
        return -1;

    Session oSession(oPort, oConfig);
    std::cout << "syncing with interpreter ..." << std::endl;
    NodeResult eResult = oSession.sync();
    if (eResult != RESULT_Ok)
    {
        std::cout << "failed to sync with device: " << resultString(eResult) << std::endl;
        return -1;
    }
    std::cout << " ... done, " << oSession.baudrate() << " baud." << std::endl;

    if (szReceiver)
        eResult = Admin(oSession).prepare(strReceiver);
    if (eResult == RESULT_Ok)
        eResult = runCommand(oSession, aArgs, oConfig.m_eVerify, bCompile);
    if (eResult == RESULT_InvalidArgument)
        showUsage(argv[0]);
    if ((eResult == RESULT_Ok) && bRestart)
    {
        std::string strResponse;
        eResult = Admin(oSession).nodeRestart(strResponse);
    }

    oSession.close();
    if (eResult != RESULT_Ok)
    {
        std::cout << "failed: " << resultString(eResult) << std::endl;
        return -1;
    }
    return 0;
}
