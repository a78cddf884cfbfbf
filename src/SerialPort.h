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

#ifndef NODEPROG_SERIALPORT_H
#define NODEPROG_SERIALPORT_H

#include <termios.h>
#include <string>
#include "SerialLink.h"

// serial port access via POSIX termios
class SerialPort : public SerialLink
{
public:
    // Serial device access: see http://www.tldp.org/HOWTO/Serial-Programming-HOWTO/x115.html
    explicit SerialPort(bool bDebug);
    ~SerialPort();

    bool open(const char *szPortName, int nBaud, long nTimeoutUs);
    bool isOpen() const { return m_nFd >= 0; }

    virtual bool write(const unsigned char *pData, size_t nLen);
    virtual void flush();
    virtual int read(unsigned char *pData, size_t nLen);
    virtual long timeout() const { return m_nTimeoutUs; }
    virtual void setTimeout(long nTimeoutUs) { m_nTimeoutUs = nTimeoutUs; }
    virtual int baudrate() const { return m_nBaud; }
    virtual bool setBaudrate(int nBaud);
    virtual void setDtr(bool bOn);
    virtual void setRts(bool bOn);
    virtual void close();

    // termios speed constant for a baud rate, B0 if unsupported
    static speed_t speedFor(int nBaud);

private:
    void setModemLine(int nLine, bool bOn);

    std::string m_strPortName;
    int m_nFd;
    bool m_bDebug;
    int m_nBaud;
    long m_nTimeoutUs;
    termios m_oOldTio;
    termios m_oNewTio;
};

#endif // NODEPROG_SERIALPORT_H
