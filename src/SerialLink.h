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

#ifndef NODEPROG_SERIALLINK_H
#define NODEPROG_SERIALLINK_H

#include <stddef.h>

// duplex byte stream to the device, as used by the session and the transfer protocols
class SerialLink
{
public:
    virtual ~SerialLink() {}

    // write all bytes, false on error
    virtual bool write(const unsigned char *pData, size_t nLen) = 0;
    // wait until all written bytes left the host
    virtual void flush() = 0;
    // read up to nLen bytes, waiting at most timeout() microseconds for them;
    // returns the number of bytes read (0 on timeout) or -1 on error
    virtual int read(unsigned char *pData, size_t nLen) = 0;

    virtual long timeout() const = 0;
    virtual void setTimeout(long nTimeoutUs) = 0;
    virtual int baudrate() const = 0;
    virtual bool setBaudrate(int nBaud) = 0;

    // modem control lines, used to reset the device
    virtual void setDtr(bool bOn) = 0;
    virtual void setRts(bool bOn) = 0;

    virtual void close() = 0;
};

#endif // NODEPROG_SERIALLINK_H
