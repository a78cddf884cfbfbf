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

#include "Session.h"
#include "Expect.h"
#include "Output.h"

#include <unistd.h>
#include <sstream>
#include <iostream>

// the device prints this tag, followed by a fresh prompt
static const char *const SYNC_COMMAND = "print(\"%sync%\");";
static const char *const SYNC_REPLY = "%sync%\r\n> ";

static std::string uartSetup(int nBaud)
{
    std::stringstream oCmd;
    oCmd << "uart.setup(0," << nBaud << ",8,0,1,1)";
    return oCmd.str();
}

Session::Session(SerialLink &oLink, const NodeConfig &oConfig) :
    m_oLink(oLink),
    m_oConfig(oConfig),
    m_eState(SESSION_Unsynced),
    m_bWasSynced(false),
    m_bClosed(false),
    m_nLineNumber(0)
{
    m_oLink.setTimeout((long)m_oConfig.m_nTimeoutMs * 1000);
}

Session::~Session()
{
    close();
}

NodeResult Session::sync()
{
    m_eState = SESSION_Unsynced;

    // after a restart the interpreter is back at its boot baud rate
    if ((m_oLink.baudrate() != DEFAULT_BAUD) && !m_oLink.setBaudrate(DEFAULT_BAUD))
    {
        std::cerr << "failed to switch host to " << DEFAULT_BAUD << " baud" << std::endl;
        return RESULT_IoError;
    }

    // RTS is wired to CH_PD (reset) and DTR to GPIO0 on the usual boards:
    // releasing both resets the device into the interpreter
    m_oLink.setRts(false);
    m_oLink.setDtr(false);

    // the whole handshake shares one deadline
    long long nDeadline = monotonicUs() + (long long)m_oConfig.m_nTimeoutMs * 1000;

    // get a defined state, whatever the boot banner left behind
    exchange(";");
    long long nLeftMs = (nDeadline - monotonicUs()) / 1000;
    if (!checkMarker(nLeftMs > 0? (int)nLeftMs: 0))
    {
        std::cerr << "no sync with interpreter prompt" << std::endl;
        return RESULT_SyncFailed;
    }
    m_eState = SESSION_Synced;
    m_bWasSynced = true;

    if (m_oConfig.m_nBaud != m_oLink.baudrate())
        return changeBaudrate(m_oConfig.m_nBaud);
    return RESULT_Ok;
}

bool Session::checkMarker(int nTimeoutMs)
{
    writeln(SYNC_COMMAND);
    return endsWith(expect(SYNC_REPLY, nTimeoutMs), SYNC_REPLY);
}

NodeResult Session::changeBaudrate(int nBaud)
{
    std::cout << "changing communication to " << nBaud << " baud" << std::endl;
    if (!writeln(uartSetup(nBaud)))
    {
        m_eState = SESSION_Unsynced;
        return RESULT_IoError;
    }

    // the command must have left the host before the host switches speed
    usleep(100000);
    if (!m_oLink.setBaudrate(nBaud))
    {
        std::cerr << "failed to switch host to " << nBaud << " baud" << std::endl;
        m_eState = SESSION_Unsynced;
        return RESULT_IoError;
    }

    // settle framing at the new speed
    exchange("");
    exchange("");
    if (m_oConfig.m_bResyncAfterBaud && !checkMarker(m_oConfig.m_nTimeoutMs))
    {
        std::cerr << "no sync with interpreter prompt at " << nBaud << " baud" << std::endl;
        m_eState = SESSION_Unsynced;
        return RESULT_SyncFailed;
    }
    // the settling exchanges may have seen line noise instead of a prompt
    m_eState = SESSION_Synced;
    return RESULT_Ok;
}

void Session::close()
{
    if (m_bClosed)
        return;
    // the device may still run at the session baud rate after an aborted transfer
    if (m_bWasSynced)
        writeln(uartSetup(DEFAULT_BAUD));
    m_oLink.close();
    m_eState = SESSION_Unsynced;
    m_bClosed = true;
}

bool Session::write(const std::string &strData)
{
    if (!m_oLink.write((const unsigned char *)strData.data(), strData.size()))
        return false;
    m_oLink.flush();
    return true;
}

bool Session::writeln(const std::string &strLine)
{
    if (m_oConfig.m_bDebug)
        std::cout << "write: " << printable(strLine) << std::endl;
    m_nLineNumber++;
    return write(strLine + "\n");
}

std::string Session::expect(const std::string &strPattern)
{
    return ::expect(m_oLink, strPattern, m_oConfig.m_nTimeoutMs, m_oConfig.m_bDebug);
}

std::string Session::expect(const std::string &strPattern, int nTimeoutMs)
{
    return ::expect(m_oLink, strPattern, nTimeoutMs, m_oConfig.m_bDebug);
}

bool Session::checkSynced(const std::string &strOperation) const
{
    if (synced())
        return true;
    std::cerr << strOperation << ": not in sync with the interpreter prompt" << std::endl;
    return false;
}

std::string Session::exchange(const std::string &strLine)
{
    std::string strResponse;
    if (writeln(strLine))
        strResponse = expect(PROMPT);
    if (!endsWith(strResponse, PROMPT))
        m_eState = SESSION_Unsynced;
    return strResponse;
}

bool Session::readAck()
{
    unsigned char nByte = 0;
    int nRet = m_oLink.read(&nByte, 1);
    if (m_oConfig.m_bDebug)
    {
        if (nRet == 1)
            std::cout << "ack read " << outputHex2(nByte) << std::endl;
        else
            std::cout << "ack read: nothing" << std::endl;
    }
    return (nRet == 1) && (nByte == ACK);
}
