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

#ifndef NODEPROG_RESPONSE_H
#define NODEPROG_RESPONSE_H

#include <stddef.h>
#include <string>
#include <vector>

// Parsers for interpreter responses. A response as returned by Session::exchange()
// holds the echo of the command, the command output and the trailing prompt.

// Split "<echo>\n<size>\n<payload>" of a download command.
// The payload is capped to nChunkSize bytes, the rest is prompt or error text.
bool parseDownloadResponse(const std::string &strResponse, size_t nChunkSize, size_t &nTotalSize, std::string &strPayload);

// line nIndex of the response without line terminator and trailing blanks
bool responseLine(const std::string &strResponse, size_t nIndex, std::string &strLine);

// lines of the response, "\r\n" and "\n" terminated
std::vector<std::string> splitLines(const std::string &strResponse);

// true if the interpreter reported an error for the command
bool commandFailed(const std::string &strResponse);

// true if the name can be embedded into a Lua string literal of a command
bool isSafeRemoteName(const std::string &strName);

#endif // NODEPROG_RESPONSE_H
