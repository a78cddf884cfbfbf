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

#include "SerialPort.h"
#include "Output.h"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <time.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <iostream>

SerialPort::SerialPort(bool bDebug) :
    m_strPortName(""),
    m_nFd(-1),
    m_bDebug(bDebug),
    m_nBaud(0),
    m_nTimeoutUs(0)
{
}

SerialPort::~SerialPort()
{
    close();
}

speed_t SerialPort::speedFor(int nBaud)
{
    switch (nBaud)
    {
    case 1200: return B1200;
    case 2400: return B2400;
    case 4800: return B4800;
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
#ifdef B460800
    case 460800: return B460800;
#endif
#ifdef B921600
    case 921600: return B921600;
#endif
    default: return B0;
    }
}

bool SerialPort::open(const char *szPortName, int nBaud, long nTimeoutUs)
{
    if (m_nFd >= 0)
        return false;
    speed_t nSpeed = speedFor(nBaud);
    if (nSpeed == B0)
    {
        std::cerr << "unsupported baud rate " << nBaud << std::endl;
        return false;
    }

    m_strPortName = szPortName;
    m_nFd = ::open(szPortName, O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (m_nFd < 0)
    {
        std::cerr << "open(" << m_strPortName << "): ";
        perror("");
        return false;
    }
    std::cout << "open " << m_strPortName << ": " << m_nFd << std::endl;

    tcgetattr(m_nFd, &m_oOldTio);   // save current port settings

    memset(&m_oNewTio, 0, sizeof(m_oNewTio));
    m_oNewTio.c_cflag = CS8 | CLOCAL | CREAD;
    m_oNewTio.c_iflag = IGNPAR;
    m_oNewTio.c_oflag = 0;
    m_oNewTio.c_lflag = 0;          // set input mode (non-canonical, no echo,...)
    m_oNewTio.c_cc[VTIME] = 0;      // timeouts are handled by poll()
    m_oNewTio.c_cc[VMIN] = 0;
    cfsetispeed(&m_oNewTio, nSpeed);
    cfsetospeed(&m_oNewTio, nSpeed);

    tcflush(m_nFd, TCIFLUSH);
    if (tcsetattr(m_nFd, TCSANOW, &m_oNewTio) < 0)
    {
        std::cerr << "tcsetattr(" << m_strPortName << "): ";
        perror("");
        ::close(m_nFd);
        m_nFd = -1;
        return false;
    }

    m_nBaud = nBaud;
    m_nTimeoutUs = nTimeoutUs;
    return true;
}

void SerialPort::close()
{
    if (m_nFd < 0)
        return;
    tcsetattr(m_nFd, TCSANOW, &m_oOldTio);
    ::close(m_nFd);
    m_nFd = -1;
    m_strPortName = "";
}

void SerialPort::flush()
{
    if (m_nFd < 0)
        return;
    tcdrain(m_nFd);
}

bool SerialPort::write(const unsigned char *pData, size_t nLen)
{
    if (m_nFd < 0)
        return false;
    if (m_bDebug)
        std::cout << "send " << hexDump(pData, nLen) << std::endl;
    size_t nCnt = 0;
    while (nCnt < nLen)
    {
        ssize_t nRet = ::write(m_nFd, pData + nCnt, nLen - nCnt);
        if (nRet < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
            {
                // output buffer full: wait until the driver accepts more
                pollfd oPoll = { m_nFd, POLLOUT, 0 };
                poll(&oPoll, 1, 100);
                continue;
            }
            std::cerr << "write(" << m_strPortName << "): ";
            perror("");
            return false;
        }
        nCnt += nRet;
    }
    return true;
}

int SerialPort::read(unsigned char *pData, size_t nLen)
{
    if (m_nFd < 0)
        return -1;
    timespec oNow;
    clock_gettime(CLOCK_MONOTONIC, &oNow);
    long long nEnd = (long long)oNow.tv_sec * 1000000 + oNow.tv_nsec / 1000 + m_nTimeoutUs;
    size_t nCnt = 0;
    while (nCnt < nLen)
    {
        ssize_t nRet = ::read(m_nFd, pData + nCnt, nLen - nCnt);
        if (nRet < 0 && errno != EAGAIN && errno != EINTR)
        {
            std::cerr << "read(" << m_strPortName << "): ";
            perror("");
            return -1;
        }
        if (nRet > 0)
        {
            nCnt += nRet;
            continue;
        }

        clock_gettime(CLOCK_MONOTONIC, &oNow);
        long long nLeft = nEnd - ((long long)oNow.tv_sec * 1000000 + oNow.tv_nsec / 1000);
        if (nLeft <= 0)
            break;
        // ppoll for sub-millisecond waits
        pollfd oPoll = { m_nFd, POLLIN, 0 };
        timespec oWait = { (time_t)(nLeft / 1000000), (long)(nLeft % 1000000) * 1000 };
        if (ppoll(&oPoll, 1, &oWait, 0) < 0 && errno != EINTR)
        {
            std::cerr << "poll(" << m_strPortName << "): ";
            perror("");
            return -1;
        }
    }
    if (m_bDebug && nCnt > 0)
        std::cout << "recv " << hexDump(pData, nCnt) << std::endl;
    return (int)nCnt;
}

bool SerialPort::setBaudrate(int nBaud)
{
    speed_t nSpeed = speedFor(nBaud);
    if (m_nFd < 0 || nSpeed == B0)
        return false;
    cfsetispeed(&m_oNewTio, nSpeed);
    cfsetospeed(&m_oNewTio, nSpeed);
    if (tcsetattr(m_nFd, TCSADRAIN, &m_oNewTio) < 0)
    {
        std::cerr << "tcsetattr(" << m_strPortName << "): ";
        perror("");
        return false;
    }
    m_nBaud = nBaud;
    return true;
}

void SerialPort::setModemLine(int nLine, bool bOn)
{
    if (m_nFd < 0)
        return;
    if (ioctl(m_nFd, bOn? TIOCMBIS: TIOCMBIC, &nLine) < 0)
    {
        std::cerr << "ioctl(" << m_strPortName << "): ";
        perror("");
    }
}

void SerialPort::setDtr(bool bOn)
{
    setModemLine(TIOCM_DTR, bOn);
}

void SerialPort::setRts(bool bOn)
{
    setModemLine(TIOCM_RTS, bOn);
}
