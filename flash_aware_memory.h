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
// TargetMemory layer for LPC55xx devices where reading erased flash results in a bus fault.
//
// Reads which fall completely within a flash region first ask the flash controller to run a margin check on the
// requested range. Erased ranges are returned as all 0xFF bytes without touching the flash itself. Everything else
// is passed through to the raw memory interface of the MEM-AP.
#ifndef FLASH_AWARE_MEMORY_H_
#define FLASH_AWARE_MEMORY_H_

#include "errors.h"
#include "memory_map.h"
#include "session.h"
#include "transport.h"


class CpuCore;


class FlashAwareMemory : public TargetMemory
{
public:
    // Flash controller registers. The controller is accessed through its secure alias when the core is executing in
    // the secure state.
    static const uint32_t FLASH_NONSECURE_Base = 0x40034000;
    static const uint32_t FLASH_SECURE_Base = 0x50034000;
    static const uint32_t FLASH_CMD_Offset = 0x000;
    static const uint32_t FLASH_STARTA_Offset = 0x010;
    static const uint32_t FLASH_STOPA_Offset = 0x014;
    static const uint32_t FLASH_DATAW0_Offset = 0x080;
    static const uint32_t FLASH_INT_STATUS_Offset = 0xFE0;
    static const uint32_t FLASH_INT_CLR_STATUS_Offset = 0xFE8;

    // Command which verifies that the range between STARTA and STOPA can be read with normal margins.
    static const uint32_t FLASH_CMD_MARGIN_CHECK = 6;
    // INT_STATUS bits.
    static const uint32_t FLASH_INT_FAIL_Bit = 1 << 0;
    static const uint32_t FLASH_INT_ERR_Bit = 1 << 1;
    static const uint32_t FLASH_INT_DONE_Bit = 1 << 2;
    static const uint32_t FLASH_INT_ECC_ERR_Bit = 1 << 3;
    static const uint32_t FLASH_INT_ALL_Bits = 0xF;

    // The caller retains ownership of all of the objects passed in.
    FlashAwareMemory(TargetMemory* pRawMemory, const MemoryMap* pMemoryMap, Session* pSession);

    // The core whose security state selects the flash controller alias. The non-secure alias is used until a core
    // has been attached.
    void setCore(CpuCore* pCore)
    {
        m_pCore = pCore;
    }

    // Software breakpoints placed by this manager are filtered out of byte sized reads from flash. Can be NULL.
    void setBreakpointManager(BreakpointManager* pBreakpoints)
    {
        m_pBreakpoints = pBreakpoints;
    }

    // Run a margin check over [address, address + size) which must be within a single flash region.
    //
    // Returns true if the check completed and *pIsErased has been set.
    // Returns false otherwise and getLastError() indicates why (ie. ERROR_PROBE_TIMEOUT).
    bool isFlashErased(uint32_t address, uint32_t size, bool* pIsErased);

    // TargetMemory interface.
    virtual uint32_t readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize);
    virtual uint32_t writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize, TransferSize writeSize);
    virtual ErrorCode getLastReadWriteError()
    {
        return m_lastError.code;
    }
    virtual void flush()
    {
        m_pRawMemory->flush();
    }

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    bool isFlashErased(const MemoryRegion* pRegion, uint32_t address, uint32_t size, bool* pIsErased);
    bool getFlashControllerBase(uint32_t* pBase);
    bool waitForMarginCheck(uint32_t flashBase, uint32_t* pStatus);
    bool read32(uint32_t address, uint32_t* pValue);
    bool write32(uint32_t address, uint32_t value);
    uint32_t readRaw(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize);
    bool setError(ErrorCode code, const char* pOperation);
    bool setRawError(const char* pOperation);

    TargetMemory*       m_pRawMemory;
    const MemoryMap*    m_pMemoryMap;
    Session*            m_pSession;
    CpuCore*            m_pCore;
    BreakpointManager*  m_pBreakpoints;
    ErrorInfo           m_lastError;
};

#endif // FLASH_AWARE_MEMORY_H_
