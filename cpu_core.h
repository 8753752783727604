/* Copyright 2023 Adam Green (https://github.com/adamgreen/)

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
#ifndef CPU_CORE_H_
#define CPU_CORE_H_

#include <memory>
#include "access_port.h"
#include "errors.h"
#include "memory_map.h"
#include "session.h"
#include "transport.h"

class HardwareWatchpoints;
class ResetSequencer;


// Give friendly names to the DCRSR indices of important registers.
static const uint32_t R0 = 0;
static const uint32_t R12 = 12;
static const uint32_t SP = 13;
static const uint32_t LR = 14;
static const uint32_t PC = 15;
static const uint32_t XPSR = 16;
static const uint32_t MSP = 17;
static const uint32_t PSP = 18;
// CONTROL, FAULTMASK, BASEPRI, and PRIMASK are all accessed through this single DCRSR index.
static const uint32_t SPECIAL_REGS = 0x14;

// Security state that the core is executing in (ARMv8-M only, others are always non-secure).
enum SecurityState
{
    SECURITY_NONSECURE,
    SECURITY_SECURE
};


// Expose debug operations on a single Cortex-M core.
class CpuCore
{
public:
    // pMemory is the memory interface used for all accesses made by this core. It is typically the raw memory
    // interface of the core's MEM-AP but device families can interpose their own layer.
    CpuCore(Session* pSession, DebugProbe* pProbe, AccessPort* pAP, TargetMemory* pMemory,
            const MemoryMap* pMemoryMap, uint32_t coreId);
    virtual ~CpuCore();

    uint32_t getCoreId() const
    {
        return m_coreId;
    }
    AccessPort* getAccessPort()
    {
        return m_pAP;
    }
    Session* getSession()
    {
        return m_pSession;
    }
    const MemoryMap* getMemoryMap() const
    {
        return m_pMemoryMap;
    }

    // Enables this core for debugging. This enables halting debug, vector catch, and the Data Watchpoint and Flash
    // Breakpoint units.
    bool initForDebugging();

    // Read from the requested memory range on this core.
    //
    // Returns the number of bytes read. getLastError() indicates why if that is less than bufferSize.
    uint32_t readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize);

    // Write to the requested memory range on this core.
    //
    // Returns the number of bytes written. getLastError() indicates why if that is less than bufferSize.
    uint32_t writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize, TransferSize writeSize);

    // 32-bit memory mapped register helpers. They return false on failure and getLastError() indicates why.
    bool read32(uint32_t address, uint32_t* pValue);
    bool write32(uint32_t address, uint32_t value);

    // Flush queued transfers and clear sticky errors in the transport.
    void flush()
    {
        m_pMemory->flush();
    }

    // Read the DHCSR and cache it for use by isResetting() and isHalted().
    bool readDHCSR(uint32_t* pValue);
    bool writeDHCSR(uint32_t DHCSR_Value);
    bool isResetting() const
    {
        return !!(m_currentDHCSR & DHCSR_S_RESET_ST_Bit);
    }
    bool isHalted() const
    {
        return !!(m_currentDHCSR & DHCSR_S_HALT_Bit);
    }

    // Request the core to halt.
    bool halt();
    // Wait for a previous halt() to take effect.
    bool waitForCoreToHalt(uint32_t timeout_ms);
    // Resumes execution of this core.
    bool resume();

    bool readDEMCR(uint32_t* pValue);
    bool writeDEMCR(uint32_t value);
    bool setOrClearBitsInDEMCR(uint32_t bitMask, bool set);

    // Transfer core registers through DCRSR/DCRDR. The core must be halted.
    bool readCpuRegister(uint32_t registerIndex, uint32_t* pValue);
    bool writeCpuRegister(uint32_t registerIndex, uint32_t value);

    // Determine the core's current security state from DSCSR.CDS.
    bool getSecurityState(SecurityState* pState);

    // Is this an ARMv8-M core? Determined from the CPUID register on first use.
    bool isArmV8M();

    // The reset type used when neither reset() nor the SessionOptions request a specific one.
    ResetType getDefaultResetType() const
    {
        return m_defaultResetType;
    }
    void setDefaultResetType(ResetType type)
    {
        m_defaultResetType = type;
    }
    // Resolve RESET_DEFAULT into a concrete reset type using the session options and then this core's default.
    ResetType resolveResetType(ResetType type) const;

    // Reset the core, returning once it has left reset. Observers are notified before and after the reset.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why (ie. ERROR_RESET_TIMEOUT).
    bool reset(ResetType type = RESET_DEFAULT);

    // Assert the requested reset mechanism without any of the surrounding sequencing done by reset().
    bool performReset(ResetType type);

    // Arm/disarm the core to halt at the first instruction after the next reset.
    virtual bool setResetCatch(ResetType type = RESET_DEFAULT);
    virtual bool clearResetCatch(ResetType type = RESET_DEFAULT);

    // Counter incremented on every reset so that cached target state can be invalidated.
    uint32_t getRunToken() const
    {
        return m_runToken;
    }
    void incrementRunToken()
    {
        m_runToken++;
    }

    // Was the flash found to be erased during the last reset catch activation? Assumed to be erased until the first
    // activation has been made.
    bool isFlashErased() const
    {
        return m_isFlashErased;
    }
    void setFlashErased(bool isErased)
    {
        m_isFlashErased = isErased;
    }

    // The breakpoint manager defaults to a DWT based HardwareWatchpoints object owned by the core. The caller
    // retains ownership of any manager passed to setBreakpointManager().
    BreakpointManager* getBreakpointManager()
    {
        return m_pBreakpoints;
    }
    void setBreakpointManager(BreakpointManager* pBreakpoints)
    {
        m_pBreakpoints = pBreakpoints;
    }

    ResetSequencer* getResetSequencer()
    {
        return m_pResetSequencer.get();
    }

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }
    void setLastError(const ErrorInfo& error)
    {
        m_lastError = error;
    }

    // Debug Halting Control and Status Register.
    static const uint32_t DHCSR_Address = 0xE000EDF0;
    static const uint32_t DHCSR_C_DEBUGEN_Bit = 1 << 0;
    static const uint32_t DHCSR_C_HALT_Bit = 1 << 1;
    static const uint32_t DHCSR_S_REGRDY_Bit = 1 << 16;
    static const uint32_t DHCSR_S_HALT_Bit = 1 << 17;
    // Sticky bit which is set when the core is reset and cleared when DHCSR is read.
    static const uint32_t DHCSR_S_RESET_ST_Bit = 1 << 25;

    // Debug Exception and Monitor Control Register.
    static const uint32_t DEMCR_Address = 0xE000EDFC;
    static const uint32_t DEMCR_VC_CORERESET_Bit = 1 << 0;

    // Flash Patch and Breakpoint unit.
    static const uint32_t FP_CTRL_Address = 0xE0002000;
    static const uint32_t FP_COMP0_Address = 0xE0002008;

    // Data Watchpoint and Trace unit.
    static const uint32_t DWT_CTRL_Address = 0xE0001000;
    static const uint32_t DWT_COMP0_Address = 0xE0001020;

protected:
    void enableDWTandVectorCatches();
    bool enableHaltDebugging();
    void initFPB();
    bool setError(ErrorCode code, const char* pOperation);
    bool setMemoryError(const char* pOperation);
    bool waitForRegisterTransferToComplete();
    bool performHardwareReset();
    bool performSystemResetRequest(uint32_t AIRCR_ResetBit);
    bool performEmulatedReset();

    Session*                                m_pSession;
    DebugProbe*                             m_pProbe;
    AccessPort*                             m_pAP;
    TargetMemory*                           m_pMemory;
    const MemoryMap*                        m_pMemoryMap;
    BreakpointManager*                      m_pBreakpoints;
    std::unique_ptr<HardwareWatchpoints>    m_pHardwareWatchpoints;
    std::unique_ptr<ResetSequencer>         m_pResetSequencer;
    ErrorInfo                               m_lastError;
    uint32_t                                m_coreId;
    uint32_t                                m_currentDHCSR;
    uint32_t                                m_runToken;
    ResetType                               m_defaultResetType;
    int                                     m_isArmV8M;
    bool                                    m_isFlashErased;
};

#endif // CPU_CORE_H_
