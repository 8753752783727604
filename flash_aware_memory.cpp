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
#include <string.h>
#include <pico/stdlib.h>
#define FLASH_MODULE "flash_aware_memory.cpp"
#include "logging.h"
#include "flash_aware_memory.h"
#include "cpu_core.h"


FlashAwareMemory::FlashAwareMemory(TargetMemory* pRawMemory, const MemoryMap* pMemoryMap, Session* pSession)
: m_pRawMemory(pRawMemory), m_pMemoryMap(pMemoryMap), m_pSession(pSession), m_pCore(NULL), m_pBreakpoints(NULL)
{
}

uint32_t FlashAwareMemory::readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize)
{
    m_lastError = ErrorInfo();
    if (bufferSize == 0)
    {
        return 0;
    }

    const MemoryRegion* pRegion = m_pMemoryMap->getRegionForRange(address, bufferSize);
    if (pRegion == NULL || !pRegion->isFlash())
    {
        return readRaw(address, pvBuffer, bufferSize, readSize);
    }

    bool isErased = false;
    if (!isFlashErased(pRegion, address, bufferSize, &isErased))
    {
        return 0;
    }
    if (isErased)
    {
        logDebugF("0x%08" PRIX32 " - 0x%08" PRIX32 " is erased.", address, address + bufferSize - 1);
        memset(pvBuffer, 0xFF, bufferSize);
        return bufferSize;
    }

    uint32_t bytesRead = readRaw(address, pvBuffer, bufferSize, readSize);
    if (readSize == TRANSFER_8BIT && m_pBreakpoints != NULL)
    {
        m_pBreakpoints->filterMemory(address, (uint8_t*)pvBuffer, bytesRead);
    }
    return bytesRead;
}

uint32_t FlashAwareMemory::writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize, TransferSize writeSize)
{
    m_lastError = ErrorInfo();
    uint32_t bytesWritten = m_pRawMemory->writeMemory(address, pvBuffer, bufferSize, writeSize);
    if (bytesWritten != bufferSize)
    {
        setRawError("writeMemory");
    }
    return bytesWritten;
}

uint32_t FlashAwareMemory::readRaw(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize)
{
    uint32_t bytesRead = m_pRawMemory->readMemory(address, pvBuffer, bufferSize, readSize);
    if (bytesRead != bufferSize)
    {
        setRawError("readMemory");
    }
    return bytesRead;
}

bool FlashAwareMemory::isFlashErased(uint32_t address, uint32_t size, bool* pIsErased)
{
    m_lastError = ErrorInfo();
    if (size == 0)
    {
        logError("Can't margin check an empty range.");
        return setError(ERROR_INVALID_ARGUMENT, "isFlashErased");
    }

    const MemoryRegion* pRegion = m_pMemoryMap->getRegionForRange(address, size);
    if (pRegion == NULL || !pRegion->isFlash())
    {
        logErrorF("0x%08" PRIX32 " - 0x%08" PRIX32 " isn't contained in a flash region.", address, address + size - 1);
        return setError(ERROR_INVALID_ARGUMENT, "isFlashErased");
    }
    return isFlashErased(pRegion, address, size, pIsErased);
}

bool FlashAwareMemory::isFlashErased(const MemoryRegion* pRegion, uint32_t address, uint32_t size, bool* pIsErased)
{
    // STARTA/STOPA are in units of 16-byte flash words relative to the start of flash.
    const uint32_t FLASH_WORD_Shift = 4;
    // A passing margin check has DONE set and none of the failure bits.
    const uint32_t FLASH_INT_FAILURE_Bits = FLASH_INT_FAIL_Bit | FLASH_INT_ERR_Bit | FLASH_INT_ECC_ERR_Bit;
    uint32_t flashStart = pRegion->pAlgorithm ? pRegion->pAlgorithm->flashStart : pRegion->address;
    uint32_t startWord = (address - flashStart) >> FLASH_WORD_Shift;
    uint32_t stopWord = (address + size - 1 - flashStart) >> FLASH_WORD_Shift;
    uint32_t flashBase = 0;

    if (!getFlashControllerBase(&flashBase))
    {
        return false;
    }

    logDebugF("Margin check of flash words 0x%" PRIX32 " - 0x%" PRIX32 ".", startWord, stopWord);
    const uint32_t zeroes[8] = { 0, 0, 0, 0, 0, 0, 0, 0 };
    if (!write32(flashBase + FLASH_STARTA_Offset, startWord) ||
        !write32(flashBase + FLASH_STOPA_Offset, stopWord))
    {
        logErrorF("Failed to set flash controller address range (%s).", errorCodeName(m_lastError.code));
        return false;
    }
    if (m_pRawMemory->writeMemory(flashBase + FLASH_DATAW0_Offset, zeroes, sizeof(zeroes), TRANSFER_32BIT) != sizeof(zeroes))
    {
        logErrorF("Failed to clear flash controller DATAW registers (%s).",
                  errorCodeName(m_pRawMemory->getLastReadWriteError()));
        return setRawError("isFlashErased");
    }
    if (!write32(flashBase + FLASH_INT_CLR_STATUS_Offset, FLASH_INT_ALL_Bits) ||
        !write32(flashBase + FLASH_CMD_Offset, FLASH_CMD_MARGIN_CHECK))
    {
        logErrorF("Failed to start flash margin check (%s).", errorCodeName(m_lastError.code));
        return false;
    }

    uint32_t status = 0;
    if (!waitForMarginCheck(flashBase, &status))
    {
        return false;
    }
    *pIsErased = (status & FLASH_INT_FAILURE_Bits) != 0;
    return true;
}

bool FlashAwareMemory::getFlashControllerBase(uint32_t* pBase)
{
    SecurityState state = SECURITY_NONSECURE;
    if (m_pCore != NULL && !m_pCore->getSecurityState(&state))
    {
        m_lastError = m_pCore->getLastError();
        logErrorF("Failed to determine security state of core (%s).", errorCodeName(m_lastError.code));
        return false;
    }
    *pBase = (state == SECURITY_SECURE) ? FLASH_SECURE_Base : FLASH_NONSECURE_Base;
    return true;
}

bool FlashAwareMemory::waitForMarginCheck(uint32_t flashBase, uint32_t* pStatus)
{
    const SessionOptions& options = m_pSession->getOptions();
    absolute_time_t endTime = make_timeout_time_ms(options.flashProbeTimeoutMs);
    do
    {
        if (m_pSession->isCancelled())
        {
            return setError(ERROR_CANCELLED, "waitForMarginCheck");
        }
        if (!read32(flashBase + FLASH_INT_STATUS_Offset, pStatus))
        {
            logErrorF("Failed to read flash controller INT_STATUS (%s).", errorCodeName(m_lastError.code));
            return false;
        }
        if (*pStatus & FLASH_INT_DONE_Bit)
        {
            return true;
        }
        sleep_ms(options.flashProbePollIntervalMs);
    } while (absolute_time_diff_us(get_absolute_time(), endTime) > 0);

    logErrorF("Timed out waiting for flash margin check. INT_STATUS=0x%08" PRIX32, *pStatus);
    return setError(ERROR_PROBE_TIMEOUT, "waitForMarginCheck");
}

bool FlashAwareMemory::read32(uint32_t address, uint32_t* pValue)
{
    if (m_pRawMemory->readMemory(address, pValue, sizeof(*pValue), TRANSFER_32BIT) != sizeof(*pValue))
    {
        return setRawError("read32");
    }
    return true;
}

bool FlashAwareMemory::write32(uint32_t address, uint32_t value)
{
    if (m_pRawMemory->writeMemory(address, &value, sizeof(value), TRANSFER_32BIT) != sizeof(value))
    {
        return setRawError("write32");
    }
    return true;
}

bool FlashAwareMemory::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation);
    return false;
}

bool FlashAwareMemory::setRawError(const char* pOperation)
{
    ErrorCode code = m_pRawMemory->getLastReadWriteError();
    return setError(code != ERROR_NONE ? code : ERROR_TRANSPORT, pOperation);
}
