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
// CpuCore class which exposes the debug operations needed to bring up and reset a single Cortex-M core.
#include <pico/stdlib.h>
#define CPU_CORE_MODULE "cpu_core.cpp"
#include "logging.h"
#include "cpu_core.h"
#include "hardware_watchpoints.h"
#include "reset_sequencer.h"


CpuCore::CpuCore(Session* pSession, DebugProbe* pProbe, AccessPort* pAP, TargetMemory* pMemory,
                 const MemoryMap* pMemoryMap, uint32_t coreId)
: m_pSession(pSession), m_pProbe(pProbe), m_pAP(pAP), m_pMemory(pMemory), m_pMemoryMap(pMemoryMap),
  m_pBreakpoints(NULL), m_coreId(coreId), m_currentDHCSR(0), m_runToken(0),
  m_defaultResetType(RESET_SW_SYSRESETREQ), m_isArmV8M(-1), m_isFlashErased(true)
{
    m_pHardwareWatchpoints.reset(new HardwareWatchpoints(this));
    m_pBreakpoints = m_pHardwareWatchpoints.get();
    m_pResetSequencer.reset(new ResetSequencer(this));
}

CpuCore::~CpuCore()
{
}

bool CpuCore::initForDebugging()
{
    if (!enableHaltDebugging())
    {
        return false;
    }
    enableDWTandVectorCatches();
    if (!m_pHardwareWatchpoints->init())
    {
        logErrorF("Core%" PRIu32 ": Failed to clear DWT comparators.", m_coreId);
    }
    initFPB();
    return true;
}

bool CpuCore::enableHaltDebugging()
{
    uint32_t DHCSR_Val = 0;
    if (!readDHCSR(&DHCSR_Val))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DHCSR to enable debugging.", m_coreId);
        return false;
    }

    // The values of the current DHCSR_C_* bits will be overwritten with just what is needed to enable debugging
    // but a halted core must stay halted.
    DHCSR_Val = (DHCSR_Val & DHCSR_S_HALT_Bit) ? DHCSR_C_HALT_Bit : 0;
    DHCSR_Val |= DHCSR_C_DEBUGEN_Bit;
    if (!writeDHCSR(DHCSR_Val))
    {
        logErrorF("Core%" PRIu32 ": Failed to set C_DEBUGEN bit in DHCSR.", m_coreId);
        return false;
    }
    return true;
}

void CpuCore::enableDWTandVectorCatches()
{
    // DEMCR_DWTENA is the name on ARMv6M and it is called TRCENA on ARMv7M.
    const uint32_t DEMCR_DWTENA_Bit = 1 << 24;
    // Enable Reset Vector Catch on HardFault.
    const uint32_t DEMCR_VC_HARDERR_Bit = 1 << 10;
    // Enable Reset Vector Catch on BusFault.
    const uint32_t DEMCR_VC_BUSERR_Bit = 1 << 8;
    const uint32_t allVectorCatchBits = DEMCR_VC_HARDERR_Bit | DEMCR_VC_BUSERR_Bit;

    if (!setOrClearBitsInDEMCR(DEMCR_DWTENA_Bit | allVectorCatchBits, true))
    {
        logErrorF("Core%" PRIu32 ": Failed to set DWTENA/TRCENA and vector catch bits in DEMCR register.", m_coreId);
    }
}

void CpuCore::initFPB()
{
    // Writes to FP_CTRL are ignored unless the KEY bit is set.
    const uint32_t FP_CTRL_KEY_Bit = 1 << 1;
    const uint32_t FP_CTRL_ENABLE_Bit = 1 << 0;

    uint32_t FP_CTRL_Value = 0;
    if (!read32(FP_CTRL_Address, &FP_CTRL_Value))
    {
        logErrorF("Core%" PRIu32 ": Failed to read FP_CTRL register.", m_coreId);
        return;
    }

    // Code comparator count is split over NUM_CODE2 (bits 14:12) and NUM_CODE1 (bits 7:4).
    uint32_t codeComparatorCount = (((FP_CTRL_Value >> 12) & 0x7) << 4) | ((FP_CTRL_Value >> 4) & 0xF);
    for (uint32_t i = 0 ; i < codeComparatorCount ; i++)
    {
        if (!write32(FP_COMP0_Address + i * sizeof(uint32_t), 0))
        {
            logErrorF("Core%" PRIu32 ": Failed to clear FP_COMP%" PRIu32 " register.", m_coreId, i);
        }
    }

    if (!write32(FP_CTRL_Address, FP_CTRL_KEY_Bit | FP_CTRL_ENABLE_Bit))
    {
        logErrorF("Core%" PRIu32 ": Failed to enable FPB.", m_coreId);
    }
}


uint32_t CpuCore::readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize)
{
    uint32_t bytesRead = m_pMemory->readMemory(address, pvBuffer, bufferSize, readSize);
    if (bytesRead != bufferSize)
    {
        setMemoryError("readMemory");
    }
    return bytesRead;
}

uint32_t CpuCore::writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize, TransferSize writeSize)
{
    uint32_t bytesWritten = m_pMemory->writeMemory(address, pvBuffer, bufferSize, writeSize);
    if (bytesWritten != bufferSize)
    {
        setMemoryError("writeMemory");
    }
    return bytesWritten;
}

bool CpuCore::read32(uint32_t address, uint32_t* pValue)
{
    return readMemory(address, pValue, sizeof(*pValue), TRANSFER_32BIT) == sizeof(*pValue);
}

bool CpuCore::write32(uint32_t address, uint32_t value)
{
    return writeMemory(address, &value, sizeof(value), TRANSFER_32BIT) == sizeof(value);
}

bool CpuCore::setMemoryError(const char* pOperation)
{
    return setError(m_pMemory->getLastReadWriteError(), pOperation);
}

bool CpuCore::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation, m_coreId);
    return false;
}


bool CpuCore::readDHCSR(uint32_t* pValue)
{
    // Callers poll the DHCSR through expected errors so leave it to them to log a failure.
    if (!read32(DHCSR_Address, pValue))
    {
        logDebugF("Core%" PRIu32 ": Failed to read DHCSR register (%s).", m_coreId, errorCodeName(m_lastError.code));
        return false;
    }
    m_currentDHCSR = *pValue;
    return true;
}

bool CpuCore::writeDHCSR(uint32_t DHCSR_Value)
{
    // Upper 16-bits must contain DBGKEY for CPU to accept this write.
    const uint32_t DHCSR_DBGKEY_Shift = 16;
    const uint32_t DHCSR_DBGKEY_Mask = 0xFFFF << DHCSR_DBGKEY_Shift;
    const uint32_t DHCSR_DBGKEY = 0xA05F << DHCSR_DBGKEY_Shift;
    DHCSR_Value = (DHCSR_Value & ~DHCSR_DBGKEY_Mask) | DHCSR_DBGKEY;

    return write32(DHCSR_Address, DHCSR_Value);
}

bool CpuCore::halt()
{
    if (!writeDHCSR(DHCSR_C_DEBUGEN_Bit | DHCSR_C_HALT_Bit))
    {
        logErrorF("Core%" PRIu32 ": Failed to set C_HALT bit in DHCSR.", m_coreId);
        return false;
    }
    return true;
}

bool CpuCore::waitForCoreToHalt(uint32_t timeout_ms)
{
    absolute_time_t endTime = make_timeout_time_ms(timeout_ms);
    do
    {
        uint32_t DHCSR_Val = 0;
        if (readDHCSR(&DHCSR_Val) && isHalted())
        {
            return true;
        }
    } while (absolute_time_diff_us(get_absolute_time(), endTime) > 0);

    logErrorF("Core%" PRIu32 ": Timed out waiting for core to halt.", m_coreId);
    if (m_lastError.code == ERROR_NONE)
    {
        setError(ERROR_TRANSFER_TIMEOUT, "waitForCoreToHalt");
    }
    return false;
}

bool CpuCore::resume()
{
    if (!writeDHCSR(DHCSR_C_DEBUGEN_Bit))
    {
        logErrorF("Core%" PRIu32 ": Failed to clear C_HALT bit in DHCSR.", m_coreId);
        return false;
    }
    return true;
}


bool CpuCore::readDEMCR(uint32_t* pValue)
{
    if (!read32(DEMCR_Address, pValue))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DEMCR register.", m_coreId);
        return false;
    }
    return true;
}

bool CpuCore::writeDEMCR(uint32_t value)
{
    if (!write32(DEMCR_Address, value))
    {
        logErrorF("Core%" PRIu32 ": Failed to write DEMCR register.", m_coreId);
        return false;
    }
    return true;
}

bool CpuCore::setOrClearBitsInDEMCR(uint32_t bitMask, bool set)
{
    uint32_t DEMCR_Value = 0;
    if (!readDEMCR(&DEMCR_Value))
    {
        return false;
    }

    if (set)
    {
        DEMCR_Value |= bitMask;
    }
    else
    {
        DEMCR_Value &= ~bitMask;
    }

    return writeDEMCR(DEMCR_Value);
}


// Debug Core Register Selector Register.
static const uint32_t DCRSR_Address = 0xE000EDF4;
// Specifies the access type for the transfer: 0 for read, 1 for write.
static const uint32_t DCRSR_REGWnR_Bit = 1 << 16;
// Debug Core Register Data Register.
static const uint32_t DCRDR_Address = 0xE000EDF8;

bool CpuCore::readCpuRegister(uint32_t registerIndex, uint32_t* pValue)
{
    if (!write32(DCRSR_Address, registerIndex))
    {
        logErrorF("Core%" PRIu32 ": Failed to write DCRSR register.", m_coreId);
        return false;
    }
    if (!waitForRegisterTransferToComplete())
    {
        return false;
    }
    if (!read32(DCRDR_Address, pValue))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DCRDR register.", m_coreId);
        return false;
    }
    return true;
}

bool CpuCore::writeCpuRegister(uint32_t registerIndex, uint32_t value)
{
    if (!write32(DCRDR_Address, value))
    {
        logErrorF("Core%" PRIu32 ": Failed to write DCRDR register.", m_coreId);
        return false;
    }
    if (!write32(DCRSR_Address, registerIndex | DCRSR_REGWnR_Bit))
    {
        logErrorF("Core%" PRIu32 ": Failed to write DCRSR register.", m_coreId);
        return false;
    }
    return waitForRegisterTransferToComplete();
}

bool CpuCore::waitForRegisterTransferToComplete()
{
    absolute_time_t endTime = make_timeout_time_ms(REGISTER_TRANSFER_TIMEOUT_MS);
    do
    {
        uint32_t DHCSR_Val = 0;
        if (!readDHCSR(&DHCSR_Val))
        {
            logErrorF("Core%" PRIu32 ": Failed to read DHCSR while waiting for register transfer.", m_coreId);
            return false;
        }
        if (DHCSR_Val & DHCSR_S_REGRDY_Bit)
        {
            return true;
        }
    } while (absolute_time_diff_us(get_absolute_time(), endTime) > 0);

    logErrorF("Core%" PRIu32 ": Timed out waiting for register transfer to complete.", m_coreId);
    return setError(ERROR_TRANSFER_TIMEOUT, "waitForRegisterTransferToComplete");
}


bool CpuCore::getSecurityState(SecurityState* pState)
{
    // Debug Security Control and Status Register. Reads as zero on cores without the Security Extension.
    const uint32_t DSCSR_Address = 0xE000EE08;
    // Current domain Secure.
    const uint32_t DSCSR_CDS_Bit = 1 << 16;

    uint32_t DSCSR_Value = 0;
    if (!read32(DSCSR_Address, &DSCSR_Value))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DSCSR register.", m_coreId);
        return false;
    }
    *pState = (DSCSR_Value & DSCSR_CDS_Bit) ? SECURITY_SECURE : SECURITY_NONSECURE;
    return true;
}

bool CpuCore::isArmV8M()
{
    if (m_isArmV8M >= 0)
    {
        return m_isArmV8M != 0;
    }

    const uint32_t CPUID_Address = 0xE000ED00;
    const uint32_t CPUID_PARTNO_Shift = 4;
    const uint32_t CPUID_PARTNO_Mask = 0xFFF << CPUID_PARTNO_Shift;
    // Cortex-M23, M33, M55, M85 and M35P.
    const uint32_t armV8MPartNumbers[] = { 0xD20, 0xD21, 0xD22, 0xD23, 0xD31 };

    uint32_t CPUID_Value = 0;
    if (!read32(CPUID_Address, &CPUID_Value))
    {
        logErrorF("Core%" PRIu32 ": Failed to read CPUID register.", m_coreId);
        return false;
    }

    uint32_t partNumber = (CPUID_Value & CPUID_PARTNO_Mask) >> CPUID_PARTNO_Shift;
    m_isArmV8M = 0;
    for (size_t i = 0 ; i < count_of(armV8MPartNumbers) ; i++)
    {
        if (partNumber == armV8MPartNumbers[i])
        {
            m_isArmV8M = 1;
            break;
        }
    }
    return m_isArmV8M != 0;
}


ResetType CpuCore::resolveResetType(ResetType type) const
{
    if (type == RESET_DEFAULT)
    {
        type = m_pSession->getOptions().resetType;
    }
    if (type == RESET_DEFAULT)
    {
        type = m_defaultResetType;
    }
    return type;
}

bool CpuCore::reset(ResetType type)
{
    if (!m_pResetSequencer->reset(type))
    {
        m_lastError = m_pResetSequencer->getLastError();
        return false;
    }
    return true;
}

bool CpuCore::performReset(ResetType type)
{
    // Application Interrupt and Reset Control Register bits which request a reset.
    const uint32_t AIRCR_VECTRESET_Bit = 1 << 0;
    const uint32_t AIRCR_SYSRESETREQ_Bit = 1 << 2;

    type = resolveResetType(type);
    if (type == RESET_SW_VECTRESET && isArmV8M())
    {
        logDebugF("Core%" PRIu32 ": VECTRESET isn't supported on ARMv8-M so emulating the reset.", m_coreId);
        type = RESET_SW_EMULATED;
    }

    logDebugF("Core%" PRIu32 ": Performing %s reset.", m_coreId, resetTypeName(type));
    switch (type)
    {
    case RESET_HW:
        return performHardwareReset();
    case RESET_SW_VECTRESET:
        return performSystemResetRequest(AIRCR_VECTRESET_Bit);
    case RESET_SW_EMULATED:
        return performEmulatedReset();
    case RESET_SW_SYSRESETREQ:
    default:
        return performSystemResetRequest(AIRCR_SYSRESETREQ_Bit);
    }
}

bool CpuCore::performHardwareReset()
{
    if (!m_pProbe->setResetPin(true))
    {
        logErrorF("Core%" PRIu32 ": Failed to assert nRESET.", m_coreId);
        return setError(ERROR_TRANSPORT, "performHardwareReset");
    }
    sleep_ms(m_pSession->getOptions().hardwareResetPulseMs);
    if (!m_pProbe->setResetPin(false))
    {
        logErrorF("Core%" PRIu32 ": Failed to deassert nRESET.", m_coreId);
        return setError(ERROR_TRANSPORT, "performHardwareReset");
    }
    return true;
}

bool CpuCore::performSystemResetRequest(uint32_t AIRCR_ResetBit)
{
    const uint32_t AIRCR_Address = 0xE000ED0C;
    const uint32_t AIRCR_KEY_Shift = 16;
    const uint32_t AIRCR_KEY_Mask = 0xFFFF << AIRCR_KEY_Shift;
    const uint32_t AIRCR_KEY_VALUE = 0x05FA << AIRCR_KEY_Shift;
    uint32_t AIRCR_Value = 0;
    if (!read32(AIRCR_Address, &AIRCR_Value))
    {
        logErrorF("Core%" PRIu32 ": Failed to read AIRCR register for device reset.", m_coreId);
        return false;
    }

    // Clear out the existing key value and use the special ones to enable writes.
    // Then set the reset bit to request a device or core reset.
    AIRCR_Value = (AIRCR_Value & ~AIRCR_KEY_Mask) | AIRCR_KEY_VALUE | AIRCR_ResetBit;

    if (!write32(AIRCR_Address, AIRCR_Value))
    {
        // The device can go into reset before acknowledging the write so a timeout isn't treated as a failure.
        if (m_lastError.code == ERROR_TRANSFER_TIMEOUT)
        {
            logDebugF("Core%" PRIu32 ": AIRCR write wasn't acknowledged (%s).",
                      m_coreId, errorCodeName(m_lastError.code));
            m_pMemory->flush();
            return true;
        }
        logErrorF("Core%" PRIu32 ": Failed to write AIRCR register for device reset.", m_coreId);
        return false;
    }
    return true;
}

bool CpuCore::performEmulatedReset()
{
    const uint32_t VTOR_Address = 0xE000ED08;
    // Only the Thumb bit is set in xPSR after a reset.
    const uint32_t XPSR_T_Bit = 1 << 24;

    if (!halt() || !waitForCoreToHalt(READ_DHCSR_TIMEOUT_MS))
    {
        return false;
    }

    uint32_t vectorTable = 0;
    uint32_t initialSP = 0;
    uint32_t initialPC = 0;
    if (!read32(VTOR_Address, &vectorTable) ||
        !read32(vectorTable, &initialSP) ||
        !read32(vectorTable + sizeof(uint32_t), &initialPC))
    {
        logErrorF("Core%" PRIu32 ": Failed to read the vector table for emulated reset.", m_coreId);
        return false;
    }

    for (uint32_t i = R0 ; i <= R12 ; i++)
    {
        if (!writeCpuRegister(i, 0))
        {
            return false;
        }
    }
    if (!writeCpuRegister(LR, 0xFFFFFFFF) ||
        !writeCpuRegister(XPSR, XPSR_T_Bit) ||
        !writeCpuRegister(MSP, initialSP) ||
        !writeCpuRegister(PSP, 0) ||
        !writeCpuRegister(SPECIAL_REGS, 0) ||
        !writeCpuRegister(PC, initialPC & ~1))
    {
        logErrorF("Core%" PRIu32 ": Failed to load registers for emulated reset.", m_coreId);
        return false;
    }
    return true;
}


bool CpuCore::setResetCatch(ResetType type)
{
    SetResetCatchHook* pHook = m_pSession->getHooks().pSetResetCatch;
    if (pHook != NULL && pHook->setResetCatch(this, resolveResetType(type)))
    {
        return true;
    }

    if (!setOrClearBitsInDEMCR(DEMCR_VC_CORERESET_Bit, true))
    {
        return false;
    }
    // Read DHCSR to clear a previously latched S_RESET_ST.
    uint32_t DHCSR_Val = 0;
    if (!readDHCSR(&DHCSR_Val))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DHCSR after enabling reset vector catch.", m_coreId);
        return false;
    }
    return true;
}

bool CpuCore::clearResetCatch(ResetType type)
{
    ClearResetCatchHook* pHook = m_pSession->getHooks().pClearResetCatch;
    if (pHook != NULL && pHook->clearResetCatch(this, resolveResetType(type)))
    {
        return true;
    }

    return setOrClearBitsInDEMCR(DEMCR_VC_CORERESET_Bit, false);
}
