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

#include "Admin.h"
#include "Expect.h"
#include "Response.h"
#include "Output.h"

#include <ctype.h>
#include <stdlib.h>
#include <fstream>
#include <sstream>
#include <iostream>

static std::string replaceAll(const std::string &strText, const std::string &strFrom, const std::string &strTo)
{
    std::string strResult;
    size_t nBeg = 0;
    while (true)
    {
        size_t nPos = strText.find(strFrom, nBeg);
        if (nPos == std::string::npos)
            break;
        strResult += strText.substr(nBeg, nPos - nBeg) + strTo;
        nBeg = nPos + strFrom.size();
    }
    return strResult + strText.substr(nBeg);
}

static std::string trim(const std::string &strText)
{
    size_t nBeg = 0;
    size_t nEnd = strText.size();
    while (nBeg < nEnd && isspace((unsigned char)strText[nBeg]))
        nBeg++;
    while (nEnd > nBeg && isspace((unsigned char)strText[nEnd - 1]))
        nEnd--;
    return strText.substr(nBeg, nEnd - nBeg);
}

// command output without the trailing prompt
static void printOutput(const std::string &strResponse)
{
    std::vector<std::string> aLines = splitLines(strResponse);
    if (!aLines.empty() && aLines.back() == PROMPT)
        aLines.pop_back();
    for (size_t nLine = 0; nLine < aLines.size(); nLine++)
        std::cout << aLines[nLine] << std::endl;
}

Admin::Admin(Session &oSession) :
    m_oSession(oSession)
{
}

NodeResult Admin::command(const std::string &strCommand, std::string &strResponse)
{
    strResponse.clear();
    if (!m_oSession.checkSynced(strCommand))
        return RESULT_SyncFailed;
    strResponse = m_oSession.exchange(strCommand);
    if (!endsWith(strResponse, PROMPT))
    {
        std::cerr << "no prompt after " << strCommand << ": \"" << printable(strResponse) << '"' << std::endl;
        return RESULT_Timeout;
    }
    if (commandFailed(strResponse))
    {
        std::cerr << strCommand << " failed: \"" << printable(strResponse) << '"' << std::endl;
        return RESULT_CommandFailed;
    }
    printOutput(strResponse);
    return RESULT_Ok;
}

NodeResult Admin::fileList(std::string &strResponse)
{
    std::cout << "listing files" << std::endl;
    return command("for key,value in pairs(file.list()) do print(key,value) end", strResponse);
}

NodeResult Admin::fileRemove(const std::string &strName, std::string &strResponse)
{
    if (!isSafeRemoteName(strName))
        return RESULT_InvalidArgument;
    std::cout << "remove " << strName << std::endl;
    return command("file.remove(\"" + strName + "\")", strResponse);
}

NodeResult Admin::fileDo(const std::string &strName, std::string &strResponse)
{
    if (!isSafeRemoteName(strName))
        return RESULT_InvalidArgument;
    std::cout << "executing " << strName << std::endl;
    return command("dofile(\"" + strName + "\")", strResponse);
}

NodeResult Admin::fileCompile(const std::string &strName, std::string &strResponse)
{
    if (!isSafeRemoteName(strName))
        return RESULT_InvalidArgument;
    std::cout << "compile " << strName << std::endl;
    return command("node.compile(\"" + strName + "\")", strResponse);
}

NodeResult Admin::fileFormat(std::string &strResponse)
{
    std::cout << "formatting ..." << std::endl;
    NodeResult eResult = command("file.format()", strResponse);
    if (eResult != RESULT_Ok)
        return eResult;
    if (strResponse.find("format done") == std::string::npos)
    {
        std::cerr << "format not confirmed: \"" << printable(strResponse) << '"' << std::endl;
        return RESULT_CommandFailed;
    }
    return RESULT_Ok;
}

NodeResult Admin::nodeHeap(std::string &strResponse, long &nHeap)
{
    NodeResult eResult = command("print(node.heap())", strResponse);
    if (eResult != RESULT_Ok)
        return eResult;
    std::string strLine;
    if (responseLine(strResponse, 1, strLine) && !strLine.empty() && isdigit((unsigned char)strLine[0]))
    {
        char *pEnd = 0;
        nHeap = strtol(strLine.c_str(), &pEnd, 10);
        if (*pEnd == '\0')
            return RESULT_Ok;
    }
    std::cerr << "no heap size in response \"" << printable(strResponse) << '"' << std::endl;
    return RESULT_ParseError;
}

NodeResult Admin::nodeRestart(std::string &strResponse)
{
    strResponse.clear();
    if (!m_oSession.checkSynced("node.restart()"))
        return RESULT_SyncFailed;
    std::cout << "restart" << std::endl;
    if (!m_oSession.writeln("node.restart()"))
        return RESULT_IoError;
    // boot messages follow at the ROM baud rate, collect whatever arrives
    strResponse = m_oSession.expect(PROMPT);
    m_oSession.markUnsynced();
    if (strResponse.empty())
    {
        std::cerr << "no response to node.restart()" << std::endl;
        return RESULT_Timeout;
    }
    return RESULT_Ok;
}

std::vector<std::string> Admin::scriptLines(const std::string &strScript, int nBaud)
{
    std::stringstream oBaud;
    oBaud << nBaud;
    std::string strData = replaceAll(strScript, "9600", oBaud.str());
    strData = replaceAll(strData, "\r", "");

    std::vector<std::string> aLines;
    std::stringstream oData(strData);
    std::string strLine;
    while (std::getline(oData, strLine))
    {
        strLine = trim(strLine);
        strLine = replaceAll(strLine, ", ", ",");
        strLine = replaceAll(strLine, " = ", "=");
        if (strLine.empty())
            continue;
        aLines.push_back(strLine);
    }
    return aLines;
}

NodeResult Admin::prepare(const std::string &strScript)
{
    if (!m_oSession.checkSynced("prepare"))
        return RESULT_SyncFailed;
    std::cout << "preparing device for transfer ..." << std::endl;
    std::vector<std::string> aLines = scriptLines(strScript, m_oSession.baudrate());
    for (size_t nLine = 0; nLine < aLines.size(); nLine++)
    {
        std::string strResponse = m_oSession.exchange(aLines[nLine]);
        if (!endsWith(strResponse, PROMPT))
        {
            std::cerr << "no prompt after receiver line " << nLine + 1 << std::endl;
            return RESULT_Timeout;
        }
        // a line is echoed, anything much longer is an error message
        if (commandFailed(strResponse) || (strResponse.size() > strScript.size() + 10))
        {
            std::cerr << "error in receiver script \"" << printable(strResponse) << '"' << std::endl;
            return RESULT_CommandFailed;
        }
    }
    std::cout << " ... done." << std::endl;
    return RESULT_Ok;
}

NodeResult Admin::execFile(const std::string &strPath)
{
    std::ifstream oFile(strPath.c_str(), std::ifstream::in);
    if (!oFile.is_open())
    {
        std::cerr << "failed to open " << strPath << std::endl;
        return RESULT_FileError;
    }
    std::cout << "execute " << strPath << std::endl;
    int nLine = 0;
    while (oFile.good())
    {
        std::string strLine;
        if (!std::getline(oFile, strLine))
            break;
        nLine++;
        if (!strLine.empty() && strLine[strLine.size() - 1] == '\r')
            strLine.erase(strLine.size() - 1);

        std::string strResponse;
        NodeResult eResult = command(strLine, strResponse);
        if (eResult != RESULT_Ok)
        {
            std::cerr << strPath << ":" << nLine << ": " << resultString(eResult) << std::endl;
            return eResult;
        }
    }
    return RESULT_Ok;
}
