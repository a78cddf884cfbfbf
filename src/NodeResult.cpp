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

#include "NodeResult.h"

const char *resultString(NodeResult eResult)
{
    switch (eResult)
    {
    case RESULT_Ok:
        return "ok";
    case RESULT_SyncFailed:
        return "sync failed";
    case RESULT_NoAck:
        return "no acknowledge";
    case RESULT_ParseError:
        return "unexpected response";
    case RESULT_VerifyMismatch:
        return "verification mismatch";
    case RESULT_Timeout:
        return "timeout";
    case RESULT_IoError:
        return "serial i/o error";
    case RESULT_FileError:
        return "file error";
    case RESULT_CommandFailed:
        return "command failed";
    case RESULT_InvalidArgument:
        return "invalid argument";
    }
    return "unknown";
}
