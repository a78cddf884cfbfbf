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

#ifndef NODEPROG_EXPECT_H
#define NODEPROG_EXPECT_H

#include <string>
#include "SerialLink.h"

// interpreter prompt
extern const char *const PROMPT;
// per-read timeout while waiting for a pattern
const long EXPECT_POLL_US = 100;

// Read from oLink until the received data ends with strPattern or nTimeoutMs elapsed.
// Returns everything read in both cases, check with endsWith() whether the pattern arrived.
// The link timeout is restored before returning.
std::string expect(SerialLink &oLink, const std::string &strPattern, int nTimeoutMs, bool bDebug = false);

bool endsWith(const std::string &strData, const std::string &strTail);

// monotonic clock in microseconds
long long monotonicUs();

#endif // NODEPROG_EXPECT_H
