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

#ifndef NODEPROG_NODERESULT_H
#define NODEPROG_NODERESULT_H

// outcome of every high level operation
enum NodeResult {
    RESULT_Ok = 0,
    RESULT_SyncFailed,      // handshake marker not seen, session unusable
    RESULT_NoAck,           // acknowledge byte missing or wrong during upload
    RESULT_ParseError,      // response lacks the expected structure
    RESULT_VerifyMismatch,  // transfer done, but content differs from source
    RESULT_Timeout,         // no prompt before the deadline
    RESULT_IoError,         // serial port read/write failed
    RESULT_FileError,       // local file could not be read or written
    RESULT_CommandFailed,   // interpreter reported an error
    RESULT_InvalidArgument  // request rejected before talking to the device
};

const char *resultString(NodeResult eResult);

#endif // NODEPROG_NODERESULT_H
