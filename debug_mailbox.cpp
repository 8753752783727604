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
// Driver for the debug mailbox access port (DM-AP) found on NXP LPC55xx devices.
#include <pico/stdlib.h>
#define MAILBOX_MODULE "debug_mailbox.cpp"
#include "logging.h"
#include "debug_mailbox.h"
#include "cpu_core.h"


static bool isIdrQuiescent(uint32_t value)
{
    return value == DebugMailbox::IDR_VALUE;
}

static bool isZero(uint32_t value)
{
    return value == 0;
}

static bool isReturnStatusZero(uint32_t value)
{
    return (value & DebugMailbox::RETURN_STATUS_Mask) == 0;
}


DebugMailbox::DebugMailbox(DebugPort* pDebugPort, Session* pSession)
: m_pDebugPort(pDebugPort), m_pSession(pSession)
{
}

bool DebugMailbox::resynchronize()
{
    m_lastError = ErrorInfo();
    AccessPort* pAP = m_pDebugPort->getOrCreateAP(DM_AP_Index);

    logDebug("Waiting for DM-AP to become ready.");
    if (!pollRegister(pAP, IDR_Offset, isIdrQuiescent, ERROR_TRANSFER_FAULT, "waitForIDR"))
    {
        return false;
    }

    logDebug("Requesting DM-AP resynchronization.");
    if (!writeRegister(pAP, CSW_Offset, CSW_RESYNCH_REQ_Bit | CSW_CHIP_RESET_REQ_Bit, "requestResync"))
    {
        return false;
    }
    if (!pollRegister(pAP, CSW_Offset, isZero, ERROR_TRANSFER_TIMEOUT, "waitForResyncAck"))
    {
        return false;
    }

    return startDebugSession();
}

bool DebugMailbox::startDebugSession()
{
    m_lastError = ErrorInfo();
    AccessPort* pAP = m_pDebugPort->getOrCreateAP(DM_AP_Index);

    logDebug("Starting debug session through DM-AP.");
    if (!writeRegister(pAP, REQUEST_Offset, START_DEBUG_SESSION, "startDebugSession"))
    {
        return false;
    }
    return pollRegister(pAP, RETURN_Offset, isReturnStatusZero, ERROR_TRANSFER_TIMEOUT, "waitForSessionReady");
}

ErrorCode DebugMailbox::recoverAfterReset(CpuCore* pCore)
{
    logDebugF("Core%" PRIu32 ": Resynchronizing DM-AP after reset with erased flash.", pCore->getCoreId());
    if (!resynchronize())
    {
        return m_lastError.code;
    }
    return ERROR_NONE;
}

bool DebugMailbox::pollRegister(AccessPort* pAP, uint32_t offset, PollPredicate isDone, ErrorCode retryableError,
                                const char* pOperation)
{
    const SessionOptions& options = m_pSession->getOptions();
    bool hasTimeout = options.sessionTimeoutMs != 0;
    absolute_time_t endTime = get_absolute_time();
    if (hasTimeout)
    {
        endTime = make_timeout_time_ms(options.sessionTimeoutMs);
    }

    uint32_t attempts = 0;
    do
    {
        if (m_pSession->isCancelled())
        {
            logErrorF("Session cancelled during %s.", pOperation);
            return setError(ERROR_CANCELLED, pOperation);
        }

        uint32_t value = 0;
        attempts++;
        if (pAP->readRegister(offset, &value))
        {
            if (isDone(value))
            {
                logDebugF("%s completed after %" PRIu32 " reads.", pOperation, attempts);
                return true;
            }
        }
        else if (pAP->getLastError().code != retryableError)
        {
            ErrorCode code = pAP->getLastError().code;
            logErrorF("Failed to read DM-AP register 0x%02" PRIX32 " during %s (%s).",
                      offset, pOperation, errorCodeName(code));
            return setError(code, pOperation);
        }

        if (options.dmApPollIntervalUs > 0)
        {
            sleep_us(options.dmApPollIntervalUs);
        }
    } while (!hasTimeout || absolute_time_diff_us(get_absolute_time(), endTime) > 0);

    logErrorF("Session timed out during %s.", pOperation);
    return setError(ERROR_SESSION_TIMEOUT, pOperation);
}

bool DebugMailbox::writeRegister(AccessPort* pAP, uint32_t offset, uint32_t value, const char* pOperation)
{
    if (!pAP->writeRegister(offset, value))
    {
        ErrorCode code = pAP->getLastError().code;
        logErrorF("Failed to write 0x%08" PRIX32 " to DM-AP register 0x%02" PRIX32 " (%s).",
                  value, offset, errorCodeName(code));
        return setError(code, pOperation);
    }
    return true;
}

bool DebugMailbox::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation, DM_AP_Index);
    return false;
}
