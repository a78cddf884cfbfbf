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

#ifndef NODEPROG_SESSION_H
#define NODEPROG_SESSION_H

#include <string>
#include "SerialLink.h"
#include "NodeConfig.h"
#include "NodeResult.h"

// baud rate the interpreter boots with
const int DEFAULT_BAUD = 9600;
// acknowledge byte of the device side receiver
const unsigned char ACK = 0x06;

enum SessionState {
    SESSION_Unsynced,
    SESSION_Synced
};

// line based conversation with the device interpreter over a serial link
class Session
{
public:
    Session(SerialLink &oLink, const NodeConfig &oConfig);
    ~Session();

    // reset the device and get in sync with its prompt, switch to the configured baud rate
    NodeResult sync();
    // restore the default baud rate on the device and release the link
    void close();

    SessionState state() const { return m_eState; }
    bool synced() const { return m_eState == SESSION_Synced; }
    // after a restart or an aborted transfer the prompt position is unknown
    void markUnsynced() { m_eState = SESSION_Unsynced; }
    // false, with a message, if the prompt position is unknown
    bool checkSynced(const std::string &strOperation) const;

    // send a line and return everything up to the next prompt,
    // a missing prompt leaves the session unsynced
    std::string exchange(const std::string &strLine);
    bool write(const std::string &strData);
    bool writeln(const std::string &strLine);
    std::string expect(const std::string &strPattern = "> ");
    std::string expect(const std::string &strPattern, int nTimeoutMs);
    // read one byte, true if it is ACK
    bool readAck();

    int baudrate() const { return m_oLink.baudrate(); }
    int timeoutMs() const { return m_oConfig.m_nTimeoutMs; }
    bool debug() const { return m_oConfig.m_bDebug; }
    int lineNumber() const { return m_nLineNumber; }
    SerialLink &link() { return m_oLink; }

private:
    bool checkMarker(int nTimeoutMs);
    NodeResult changeBaudrate(int nBaud);

    SerialLink &m_oLink;
    NodeConfig m_oConfig;
    SessionState m_eState;
    bool m_bWasSynced;
    bool m_bClosed;
    int m_nLineNumber;
};

#endif // NODEPROG_SESSION_H
