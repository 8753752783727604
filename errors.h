/* Copyright 2024 Adam Green (https://github.com/adamgreen/)

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
// Error codes shared by all of the swd-bringup modules.
#ifndef ERRORS_H_
#define ERRORS_H_

#include <stdint.h>
#include <string>


// Error codes that can be returned by the getLastError()/getLastReadWriteError() methods of the various objects to
// give more information about a failed call.
enum ErrorCode
{
    ERROR_NONE = 0,

    // Transport errors reported by the probe. Only the first two are considered transient and then only by the few
    // polling loops which explicitly expect them.
    //  Bus fault reported for the access (SWD FAULT response or AHB error).
    ERROR_TRANSFER_FAULT,
    //  The probe gave up waiting for the target to accept the access (too many SWD WAIT responses).
    ERROR_TRANSFER_TIMEOUT,
    //  Any other failure of the transport (protocol/parity errors, probe disconnected, etc).
    ERROR_TRANSPORT,

    // Task pipeline errors.
    ERROR_STEP_NOT_FOUND,
    ERROR_DUPLICATE_STEP,
    ERROR_PIPELINE_LOCKED,

    // The core didn't leave reset within the allotted time.
    ERROR_RESET_TIMEOUT,
    // The flash controller didn't complete a margin check within the allotted time.
    ERROR_PROBE_TIMEOUT,
    // The session wide timeout expired while polling.
    ERROR_SESSION_TIMEOUT,
    // The session was cancelled while polling.
    ERROR_CANCELLED,

    ERROR_AP_NOT_FOUND,
    ERROR_INVALID_ARGUMENT,
    ERROR_NO_FREE_COMPARATOR
};

// Details of the most recent failure recorded by an object.
struct ErrorInfo
{
    ErrorInfo()
    : code(ERROR_NONE), pOperation(""), index(-1)
    {
    }
    ErrorInfo(ErrorCode errorCode, const char* pOp, int32_t idx = -1)
    : code(errorCode), pOperation(pOp), index(idx)
    {
    }

    bool isError() const
    {
        return code != ERROR_NONE;
    }

    ErrorCode   code;
    // Short static string naming the operation which failed (ie. "readDHCSR").
    const char* pOperation;
    // Core or access port index associated with the failure, -1 if there isn't one.
    int32_t     index;
    // Identifier of the pipeline step that was executing when the failure occurred, empty if none.
    std::string step;
};

// Returns a printable name for the error code.
const char* errorCodeName(ErrorCode code);

// Is this one of the transient transport errors that a poll loop may choose to retry?
static inline bool isTransientTransportError(ErrorCode code)
{
    return code == ERROR_TRANSFER_FAULT || code == ERROR_TRANSFER_TIMEOUT;
}

#endif // ERRORS_H_
