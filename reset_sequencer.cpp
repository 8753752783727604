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
// Orchestrates the reset of a core.
#include <pico/stdlib.h>
#define RESET_MODULE "reset_sequencer.cpp"
#include "logging.h"
#include "reset_sequencer.h"
#include "cpu_core.h"


ResetSequencer::ResetSequencer(CpuCore* pCore)
: m_pCore(pCore), m_pRecovery(NULL), m_haltAfterReset(false)
{
}

bool ResetSequencer::reset(ResetType type)
{
    Session* pSession = m_pCore->getSession();
    OverrideHooks& hooks = pSession->getHooks();
    uint32_t coreId = m_pCore->getCoreId();

    type = m_pCore->resolveResetType(type);
    m_lastError = ErrorInfo();
    m_pCore->setLastError(ErrorInfo());
    logDebugF("Core%" PRIu32 ": Starting %s reset.", coreId, resetTypeName(type));

    pSession->notify(EVENT_PRE_RESET, m_pCore);
    m_pCore->incrementRunToken();

    if (hooks.pWillReset == NULL || !hooks.pWillReset->willReset(m_pCore, type))
    {
        if (!m_pCore->performReset(type))
        {
            logErrorF("Core%" PRIu32 ": Failed to perform %s reset.", coreId, resetTypeName(type));
            return setErrorFromCore("performReset");
        }
    }

    if (m_pRecovery != NULL && m_pCore->isFlashErased())
    {
        ErrorCode result = m_pRecovery->recoverAfterReset(m_pCore);
        if (result != ERROR_NONE)
        {
            logErrorF("Core%" PRIu32 ": Failed to recover debug logic after reset (%s).", coreId, errorCodeName(result));
            return setError(result, "recoverAfterReset");
        }
    }

    if (m_haltAfterReset && !m_pCore->halt())
    {
        return setErrorFromCore("halt");
    }

    // There is no default behaviour for did_reset so whether the hook handled it doesn't matter.
    if (hooks.pDidReset != NULL)
    {
        hooks.pDidReset->didReset(m_pCore, type);
    }

    if (!waitForResetExit())
    {
        return false;
    }

    pSession->notify(EVENT_POST_RESET, m_pCore);
    return true;
}

bool ResetSequencer::waitForResetExit()
{
    Session* pSession = m_pCore->getSession();
    const SessionOptions& options = pSession->getOptions();
    absolute_time_t endTime = make_timeout_time_ms(options.resetExitTimeoutMs);
    do
    {
        if (pSession->isCancelled())
        {
            return setError(ERROR_CANCELLED, "waitForResetExit");
        }

        uint32_t DHCSR_Val = 0;
        if (m_pCore->readDHCSR(&DHCSR_Val))
        {
            if ((DHCSR_Val & CpuCore::DHCSR_S_RESET_ST_Bit) == 0)
            {
                return true;
            }
        }
        else
        {
            ErrorCode code = m_pCore->getLastError().code;
            if (code != ERROR_TRANSFER_FAULT)
            {
                logErrorF("Core%" PRIu32 ": Failed to read DHCSR while leaving reset (%s).",
                          m_pCore->getCoreId(), errorCodeName(code));
                return setErrorFromCore("waitForResetExit");
            }
            m_pCore->flush();
            sleep_ms(options.resetRetryDelayMs);
        }
    } while (absolute_time_diff_us(get_absolute_time(), endTime) > 0);

    logErrorF("Core%" PRIu32 ": Timed out waiting for core to leave reset.", m_pCore->getCoreId());
    return setError(ERROR_RESET_TIMEOUT, "waitForResetExit");
}

bool ResetSequencer::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation, m_pCore->getCoreId());
    return false;
}

bool ResetSequencer::setErrorFromCore(const char* pOperation)
{
    ErrorCode code = m_pCore->getLastError().code;
    return setError(code != ERROR_NONE ? code : ERROR_TRANSPORT, pOperation);
}
