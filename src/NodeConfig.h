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

#ifndef NODEPROG_NODECONFIG_H
#define NODEPROG_NODECONFIG_H

#include <string>

// post-transfer verification
enum VerifyMode {
    VERIFY_None,        // trust the per-chunk acknowledges
    VERIFY_Standard,    // download the file again and compare byte by byte
    VERIFY_Sha1         // compare remote and local SHA-1 digests
};

// settings of one session, filled from the command line
struct NodeConfig
{
    std::string m_strPort;
    int m_nBaud;
    int m_nTimeoutMs;
    VerifyMode m_eVerify;
    bool m_bResyncAfterBaud;    // repeat the marker check after changing the baud rate
    bool m_bDebug;

    NodeConfig() :
        m_strPort(""),
        m_nBaud(9600),
        m_nTimeoutMs(5000),
        m_eVerify(VERIFY_None),
        m_bResyncAfterBaud(true),
        m_bDebug(false)
    {
    }
};

// serial port typically used by USB-UART bridges on this platform
inline const char *defaultPort()
{
#if defined(__APPLE__)
    return "/dev/tty.SLAB_USBtoUART";
#else
    return "/dev/ttyUSB0";
#endif
}

bool parseVerifyMode(const std::string &strMode, VerifyMode &eMode);

#endif // NODEPROG_NODECONFIG_H
