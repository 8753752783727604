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
// Support for the NXP LPC55xx family of Cortex-M33 microcontrollers.

// **********************************************************************************************************
// **** DEVICE_MODULE must be set to reflect the filename of this source file before including logging.h ****
// **********************************************************************************************************
#define DEVICE_MODULE "devices/lpc55xx.cpp"
#include "logging.h"
#include "lpc55xx.h"
#include "reset_sequencer.h"


Lpc55xxCore::Lpc55xxCore(Session* pSession, DebugProbe* pProbe, AccessPort* pAP, FlashAwareMemory* pMemory,
                         const MemoryMap* pMemoryMap, uint32_t coreId, DebugMailbox* pMailbox)
: CpuCore(pSession, pProbe, pAP, pMemory, pMemoryMap, coreId), m_pFlashMemory(pMemory), m_resetCatch(this)
{
    setDefaultResetType(RESET_SW_SYSRESETREQ);
    pMemory->setCore(this);
    // The DM-AP only needs to be recovered when there was no code in flash to keep the debug logic alive.
    m_pResetSequencer->setRecovery(pMailbox);
    m_pResetSequencer->setHaltAfterReset(true);
}

bool Lpc55xxCore::setResetCatch(ResetType type)
{
    if (!m_resetCatch.set(type))
    {
        m_lastError = m_resetCatch.getLastError();
        return false;
    }
    return true;
}

bool Lpc55xxCore::clearResetCatch(ResetType type)
{
    if (!m_resetCatch.clear(type))
    {
        m_lastError = m_resetCatch.getLastError();
        return false;
    }
    return true;
}



Lpc55xxFamily::Lpc55xxFamily(Session* pSession, DebugProbe* pProbe, const MemoryMap& memoryMap)
: CoreSightTarget(pSession, pProbe, memoryMap), m_mailbox(&m_debugPort, pSession)
{
}

Lpc55xxFamily::~Lpc55xxFamily()
{
    // The cores reference the flash aware memory object so they must go first.
    m_cores.clear();
}

bool Lpc55xxFamily::createInitSequence(TaskPipeline* pSequence)
{
    if (!CoreSightTarget::createInitSequence(pSequence))
    {
        return false;
    }

    return pSequence->modifyNested("discovery", [this](TaskPipeline& discovery)
    {
        return discovery.insertBefore("find_aps", "resynchronize_dm_ap", [this]() { return resynchronizeDebugMailbox(); }) &&
               discovery.modifyNested("find_components", [this](TaskPipeline& components)
               {
                   // AP1 must be switched to non-secure transfers before it is initialized.
                   if (!components.hasStep("init_ap.1"))
                   {
                       return true;
                   }
                   return components.insertBefore("init_ap.1", "set_ap1_nonsec", [this]() { return setAP1NonSecure(); });
               }) &&
               discovery.replace("create_cores", [this]() { return createLpc55xxCores(); }) &&
               discovery.insertBefore("create_components", "enable_traceclk", [this]() { return enableTraceClock(); });
    });
}

ErrorCode Lpc55xxFamily::resynchronizeDebugMailbox()
{
    if (!m_mailbox.resynchronize())
    {
        logErrorF("Failed to resynchronize DM-AP (%s).", errorCodeName(m_mailbox.getLastError().code));
        return m_mailbox.getLastError().code;
    }
    return ERROR_NONE;
}

ErrorCode Lpc55xxFamily::setAP1NonSecure()
{
    AccessPort* pAP1 = m_debugPort.getAP(1);
    if (pAP1 == NULL)
    {
        return ERROR_AP_NOT_FOUND;
    }
    pAP1->setNonSecure(true);
    return ERROR_NONE;
}

ErrorCode Lpc55xxFamily::createLpc55xxCores()
{
    AccessPort* pAP0 = m_debugPort.getAP(0);
    if (pAP0 == NULL)
    {
        logError("AP0 was not found so core 0 can't be created.");
        return ERROR_NONE;
    }

    TargetMemory* pRawMemory = m_pProbe->getMemory(0);
    if (pRawMemory == NULL)
    {
        logError("Probe has no memory interface for AP0.");
        return ERROR_AP_NOT_FOUND;
    }
    m_pFlashMemory.reset(new FlashAwareMemory(pRawMemory, &m_memoryMap, m_pSession));
    Lpc55xxCore* pCore0 = new Lpc55xxCore(m_pSession, m_pProbe, pAP0, m_pFlashMemory.get(), &m_memoryMap, 0, &m_mailbox);
    m_pFlashMemory->setBreakpointManager(pCore0->getBreakpointManager());
    addCore(pCore0);

    // Core 1 is a plain ARMv8-M core.
    AccessPort* pAP1 = m_debugPort.getAP(1);
    if (pAP1 == NULL)
    {
        return ERROR_NONE;
    }
    TargetMemory* pMemory1 = m_pProbe->getMemory(1);
    if (pMemory1 == NULL)
    {
        logError("Probe has no memory interface for AP1.");
        return ERROR_AP_NOT_FOUND;
    }
    CpuCore* pCore1 = new CpuCore(m_pSession, m_pProbe, pAP1, pMemory1, &m_memoryMap, 1);
    pCore1->setDefaultResetType(RESET_SW_SYSRESETREQ);
    addCore(pCore1);
    return ERROR_NONE;
}

ErrorCode Lpc55xxFamily::enableTraceClock()
{
    // Selects the divided trace clock.
    const uint32_t TRACECLKSEL_TRACE_DIV = 0;
    const uint32_t TRACECLKSEL_Max = 2;
    // Clearing everything above the divider (HALT, RESET, REQFLAG) enables the clock.
    const uint32_t TRACECLKDIV_DIV_Mask = 0xFF;
    const uint32_t AHBCLKCTRL0_IOCON_Bit = 1 << 13;

    CpuCore* pCore = getCore(0);
    if (m_debugPort.getAP(0) == NULL || pCore == NULL)
    {
        logDebug("Skipping trace clock setup since AP0 wasn't found.");
        return ERROR_NONE;
    }

    uint32_t clockSelect = 0;
    if (!pCore->read32(TRACECLKSEL_Address, &clockSelect))
    {
        logError("Failed to read TRACECLKSEL.");
        return pCore->getLastError().code;
    }
    if (clockSelect > TRACECLKSEL_Max && !pCore->write32(TRACECLKSEL_Address, TRACECLKSEL_TRACE_DIV))
    {
        logError("Failed to write TRACECLKSEL.");
        return pCore->getLastError().code;
    }

    uint32_t clockDivider = 0;
    if (!pCore->read32(TRACECLKDIV_Address, &clockDivider) ||
        !pCore->write32(TRACECLKDIV_Address, clockDivider & TRACECLKDIV_DIV_Mask))
    {
        logError("Failed to update TRACECLKDIV.");
        return pCore->getLastError().code;
    }

    if (!pCore->write32(AHBCLKCTRLSET0_Address, AHBCLKCTRL0_IOCON_Bit))
    {
        logError("Failed to enable IOCON clock.");
        return pCore->getLastError().code;
    }
    return ERROR_NONE;
}

bool Lpc55xxFamily::traceStart(uint32_t mode)
{
    // FUNC=6 (SWO), MODE=0, SLEW=1, INVERT=0, DIGIMODE=0, OD=0
    const uint32_t IOCON_PIO0_10_SWO = 0x46;

    m_lastError = ErrorInfo();
    CpuCore* pCore = getCore(0);
    if (pCore == NULL)
    {
        return setError(ERROR_AP_NOT_FOUND, "traceStart");
    }
    if (!pCore->write32(IOCON_PIO0_10_Address, IOCON_PIO0_10_SWO))
    {
        logError("Failed to configure PIO0_10 for SWO.");
        return setErrorFromCore(pCore);
    }

    TraceStartHook* pHook = m_pSession->getHooks().pTraceStart;
    if (pHook != NULL && pHook->traceStart(this, mode))
    {
        logDebug("Trace configured by trace_start hook.");
    }

    // A reset while ITM is enabled leaves TRACECLKDIV/TRACECLKSEL reset which would hang stimulus writes so always
    // make sure that the trace clock is running.
    ErrorCode result = enableTraceClock();
    if (result != ERROR_NONE)
    {
        return setError(result, "enableTraceClock");
    }
    return true;
}
