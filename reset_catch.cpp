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
// Reset catch for devices which can't use DEMCR.VC_CORERESET because their boot ROM runs first.
#define RESET_MODULE "reset_catch.cpp"
#include "logging.h"
#include "reset_catch.h"
#include "cpu_core.h"


ResetCatch::ResetCatch(CpuCore* pCore)
: m_pCore(pCore), m_savedDEMCR(0), m_mode(RESET_CATCH_NONE), m_hasSavedDEMCR(false), m_wasHandledByHook(false)
{
}

bool ResetCatch::set(ResetType type)
{
    uint32_t coreId = m_pCore->getCoreId();
    SetResetCatchHook* pHook = m_pCore->getSession()->getHooks().pSetResetCatch;

    if (m_mode != RESET_CATCH_NONE)
    {
        logDebugF("Core%" PRIu32 ": Disarming previous reset catch before arming it again.", coreId);
        if (!disarm())
        {
            return false;
        }
    }

    m_lastError = ErrorInfo();
    m_wasHandledByHook = pHook != NULL && pHook->setResetCatch(m_pCore, m_pCore->resolveResetType(type));
    if (m_wasHandledByHook)
    {
        logDebugF("Core%" PRIu32 ": Reset catch armed by hook.", coreId);
        return true;
    }

    if (!m_pCore->halt())
    {
        return setErrorFromCore("halt");
    }

    uint32_t DEMCR_Value = 0;
    if (!m_pCore->readDEMCR(&DEMCR_Value))
    {
        return setErrorFromCore("readDEMCR");
    }
    if (!m_pCore->writeDEMCR(DEMCR_Value & ~CpuCore::DEMCR_VC_CORERESET_Bit))
    {
        return setErrorFromCore("writeDEMCR");
    }
    // A previous failed attempt may not have been able to restore DEMCR so keep the value saved back then.
    if (!m_hasSavedDEMCR)
    {
        m_savedDEMCR = DEMCR_Value;
        m_hasSavedDEMCR = true;
    }

    // Erased flash is reported as all 1s by the core's flash aware memory interface instead of faulting.
    uint32_t resetVector = ERASED_FLASH_WORD;
    if (!m_pCore->read32(RESET_VECTOR_Address, &resetVector))
    {
        logErrorF("Core%" PRIu32 ": Failed to read reset vector.", coreId);
        setErrorFromCore("readResetVector");
        restoreDEMCR();
        return false;
    }

    bool isArmed = false;
    if (resetVector != ERASED_FLASH_WORD)
    {
        logInfoF("Core%" PRIu32 ": Code exists in flash so breaking at reset handler 0x%08" PRIX32 ".",
                 coreId, resetVector);
        m_pCore->setFlashErased(false);
        isArmed = armBreakpoint(resetVector);
    }
    else
    {
        logInfoF("Core%" PRIu32 ": Flash is empty so watching for end of boot ROM.", coreId);
        m_pCore->setFlashErased(true);
        isArmed = armWatchpoint();
    }
    if (!isArmed)
    {
        restoreDEMCR();
        return false;
    }

    // Read DHCSR to clear a potentially set DHCSR.S_RESET_ST bit.
    uint32_t DHCSR_Val = 0;
    if (!m_pCore->readDHCSR(&DHCSR_Val))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DHCSR after arming reset catch.", coreId);
        return setErrorFromCore("readDHCSR");
    }
    return true;
}

bool ResetCatch::armBreakpoint(uint32_t resetVector)
{
    // FPB revision 2 comparators hold the full address with bit 0 acting as the enable.
    const uint32_t FP_COMP_ENABLE_Bit = 1 << 0;
    // KEY | ENABLE
    const uint32_t FP_CTRL_KEY_ENABLE = 0x3;

    if (!m_pCore->write32(CpuCore::FP_COMP0_Address, resetVector | FP_COMP_ENABLE_Bit) ||
        !m_pCore->write32(CpuCore::FP_CTRL_Address, FP_CTRL_KEY_ENABLE))
    {
        logErrorF("Core%" PRIu32 ": Failed to program FPB comparator for reset catch.", m_pCore->getCoreId());
        return setErrorFromCore("armBreakpoint");
    }
    m_mode = RESET_CATCH_BREAKPOINT;
    return true;
}

bool ResetCatch::armWatchpoint()
{
    BreakpointManager* pBreakpoints = m_pCore->getBreakpointManager();
    if (!pBreakpoints->setWatchpoint(BOOTROM_MAGIC_Address, sizeof(uint32_t), MRI_PLATFORM_READWRITE_WATCHPOINT))
    {
        ErrorInfo error = pBreakpoints->getLastError();
        logErrorF("Core%" PRIu32 ": Failed to set watchpoint for reset catch (%s).",
                  m_pCore->getCoreId(), errorCodeName(error.code));
        return setError(error.code != ERROR_NONE ? error.code : ERROR_TRANSPORT, "armWatchpoint");
    }
    m_mode = RESET_CATCH_WATCHPOINT;
    return true;
}

bool ResetCatch::clear(ResetType type)
{
    ClearResetCatchHook* pHook = m_pCore->getSession()->getHooks().pClearResetCatch;

    m_lastError = ErrorInfo();
    // The activation time result decides whether the hardware needs to be disarmed.
    if (pHook != NULL)
    {
        pHook->clearResetCatch(m_pCore, m_pCore->resolveResetType(type));
    }
    if (m_wasHandledByHook)
    {
        m_wasHandledByHook = false;
        return true;
    }
    return disarm();
}

bool ResetCatch::disarm()
{
    uint32_t coreId = m_pCore->getCoreId();

    switch (m_mode)
    {
    case RESET_CATCH_BREAKPOINT:
        if (!m_pCore->write32(CpuCore::FP_COMP0_Address, 0))
        {
            logErrorF("Core%" PRIu32 ": Failed to clear FPB comparator used for reset catch.", coreId);
            return setErrorFromCore("disarmBreakpoint");
        }
        break;
    case RESET_CATCH_WATCHPOINT:
    {
        BreakpointManager* pBreakpoints = m_pCore->getBreakpointManager();
        if (!pBreakpoints->clearWatchpoint(BOOTROM_MAGIC_Address, sizeof(uint32_t), MRI_PLATFORM_READWRITE_WATCHPOINT))
        {
            ErrorInfo error = pBreakpoints->getLastError();
            logErrorF("Core%" PRIu32 ": Failed to clear watchpoint used for reset catch (%s).",
                      coreId, errorCodeName(error.code));
            return setError(error.code != ERROR_NONE ? error.code : ERROR_TRANSPORT, "disarmWatchpoint");
        }
        break;
    }
    default:
        break;
    }
    m_mode = RESET_CATCH_NONE;

    if (m_hasSavedDEMCR)
    {
        if (!m_pCore->writeDEMCR(m_savedDEMCR))
        {
            return setErrorFromCore("restoreDEMCR");
        }
        m_hasSavedDEMCR = false;
    }
    return true;
}

void ResetCatch::restoreDEMCR()
{
    // Leaves m_lastError describing the original failure.
    if (!m_pCore->writeDEMCR(m_savedDEMCR))
    {
        logErrorF("Core%" PRIu32 ": Failed to restore DEMCR after reset catch failure.", m_pCore->getCoreId());
        return;
    }
    m_hasSavedDEMCR = false;
}

bool ResetCatch::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation, m_pCore->getCoreId());
    return false;
}

bool ResetCatch::setErrorFromCore(const char* pOperation)
{
    ErrorCode code = m_pCore->getLastError().code;
    return setError(code != ERROR_NONE ? code : ERROR_TRANSPORT, pOperation);
}
