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

#ifndef NODEPROG_ADMIN_H
#define NODEPROG_ADMIN_H

#include <string>
#include <vector>
#include "Session.h"

// filesystem and node commands, one interpreter line each
class Admin
{
public:
    explicit Admin(Session &oSession);

    NodeResult fileList(std::string &strResponse);
    NodeResult fileRemove(const std::string &strName, std::string &strResponse);
    NodeResult fileDo(const std::string &strName, std::string &strResponse);
    NodeResult fileCompile(const std::string &strName, std::string &strResponse);
    NodeResult fileFormat(std::string &strResponse);
    NodeResult nodeHeap(std::string &strResponse, long &nHeap);
    // the device reboots: no prompt is expected, the session needs a new sync afterwards
    NodeResult nodeRestart(std::string &strResponse);

    // upload the receiver functions used by Transfer::upload() and shafile verification
    NodeResult prepare(const std::string &strScript);
    // run a local Lua file line by line
    NodeResult execFile(const std::string &strPath);

    // receiver script lines as sent by prepare()
    static std::vector<std::string> scriptLines(const std::string &strScript, int nBaud);

private:
    NodeResult command(const std::string &strCommand, std::string &strResponse);

    Session &m_oSession;
};

#endif // NODEPROG_ADMIN_H
