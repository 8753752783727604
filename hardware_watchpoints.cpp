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
// BreakpointManager implementation which uses the comparators of the Cortex-M Data Watchpoint and Trace (DWT) unit.
#include <stddef.h>
#define CPU_CORE_MODULE "hardware_watchpoints.cpp"
#include "logging.h"
#include "hardware_watchpoints.h"
#include "cpu_core.h"


// Bits in DWT_FUNCTION register which select the action to be taken on match (ARMv7-M) or the match type (ARMv8-M).
static const uint32_t DWT_FUNCTION_FUNCTION_Mask = 0xF;
//  ARMv7-M FUNCTION values for data address watchpoints.
static const uint32_t DWT_FUNCTION_V7_DATA_READ = 0x5;
static const uint32_t DWT_FUNCTION_V7_DATA_WRITE = 0x6;
static const uint32_t DWT_FUNCTION_V7_DATA_READWRITE = 0x7;
//  ARMv8-M MATCH values for data address watchpoints.
static const uint32_t DWT_FUNCTION_V8_DATA_READWRITE = 0x4;
static const uint32_t DWT_FUNCTION_V8_DATA_WRITE = 0x5;
static const uint32_t DWT_FUNCTION_V8_DATA_READ = 0x6;
//  ARMv8-M ACTION field. 1 generates a debug event on match.
static const uint32_t DWT_FUNCTION_V8_ACTION_DEBUG_EVENT = 1 << 4;
static const uint32_t DWT_FUNCTION_V8_ACTION_Mask = 3 << 4;
//  ARMv8-M DATAVSIZE field. Access size is 1 << DATAVSIZE bytes.
static const uint32_t DWT_FUNCTION_V8_DATAVSIZE_Shift = 10;
static const uint32_t DWT_FUNCTION_V8_DATAVSIZE_Mask = 3 << DWT_FUNCTION_V8_DATAVSIZE_Shift;


HardwareWatchpoints::HardwareWatchpoints(CpuCore* pCore)
: m_pCore(pCore)
{
}

bool HardwareWatchpoints::init()
{
    bool result = true;
    uint32_t comparatorAddress = CpuCore::DWT_COMP0_Address;
    uint32_t comparatorCount = 0;
    if (!getComparatorCount(&comparatorCount))
    {
        return false;
    }
    for (uint32_t i = 0 ; i < comparatorCount ; i++)
    {
        if (!clearComparator(comparatorAddress))
        {
            result = false;
        }
        comparatorAddress += sizeof(DWT_COMP_Type);
    }
    return result;
}

bool HardwareWatchpoints::getComparatorCount(uint32_t* pCount)
{
    uint32_t DWT_CTRL_Value = 0;
    if (!m_pCore->read32(CpuCore::DWT_CTRL_Address, &DWT_CTRL_Value))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DWT_CTRL register.", m_pCore->getCoreId());
        return setError(m_pCore->getLastError().code, "getComparatorCount");
    }
    *pCount = (DWT_CTRL_Value >> 28) & 0xF;
    return true;
}

bool HardwareWatchpoints::clearComparator(uint32_t comparatorAddress)
{
    // ARMv8-M has no DWT_MASK registers.
    bool hasMask = !m_pCore->isArmV8M();
    if (!m_pCore->write32(comparatorAddress + offsetof(DWT_COMP_Type, function), 0) ||
        !m_pCore->write32(comparatorAddress + offsetof(DWT_COMP_Type, comp), 0) ||
        (hasMask && !m_pCore->write32(comparatorAddress + offsetof(DWT_COMP_Type, mask), 0)))
    {
        logErrorF("Core%" PRIu32 ": Failed to write DWT_COMP/DWT_MASK/DWT_FUNCTION registers for clearing.",
                  m_pCore->getCoreId());
        return setError(m_pCore->getLastError().code, "clearComparator");
    }
    return true;
}

bool HardwareWatchpoints::setWatchpoint(uint32_t address, uint32_t size, PlatformWatchpointType type)
{
    m_lastError = ErrorInfo();
    if (!isValidSetting(address, size, type))
    {
        logErrorF("Core%" PRIu32 ": Watchpoint of %" PRIu32 " bytes at address 0x%08" PRIX32 " isn't supported.",
                  m_pCore->getCoreId(), size, address);
        return setError(ERROR_INVALID_ARGUMENT, "setWatchpoint");
    }

    uint32_t function = calculateFunctionValue(size, type);
    uint32_t comparatorAddress = 0;
    if (!findComparator(address, size, function, &comparatorAddress))
    {
        return false;
    }
    if (comparatorAddress != 0)
    {
        // This watchpoint has already been set.
        return true;
    }

    if (!findFreeComparator(&comparatorAddress))
    {
        return false;
    }
    if (comparatorAddress == 0)
    {
        logErrorF("Core%" PRIu32 ": No free hardware watchpoints for setting watchpoint at address 0x%08" PRIX32 ".",
                  m_pCore->getCoreId(), address);
        return setError(ERROR_NO_FREE_COMPARATOR, "setWatchpoint");
    }

    if (!attemptToSetComparator(comparatorAddress, address, size, function))
    {
        logErrorF("Core%" PRIu32 ": Failed to set watchpoint at address 0x%08" PRIX32 " of size %" PRIu32 " bytes.",
                  m_pCore->getCoreId(), address, size);
        return false;
    }
    logDebugF("Core%" PRIu32 ": Hardware watchpoint set at address 0x%08" PRIX32 ".", m_pCore->getCoreId(), address);
    return true;
}

bool HardwareWatchpoints::clearWatchpoint(uint32_t address, uint32_t size, PlatformWatchpointType type)
{
    m_lastError = ErrorInfo();
    if (!isValidSetting(address, size, type))
    {
        return setError(ERROR_INVALID_ARGUMENT, "clearWatchpoint");
    }

    uint32_t comparatorAddress = 0;
    if (!findComparator(address, size, calculateFunctionValue(size, type), &comparatorAddress))
    {
        return false;
    }
    if (comparatorAddress == 0)
    {
        // This watchpoint isn't set.
        return true;
    }

    logDebugF("Core%" PRIu32 ": Hardware watchpoint cleared at address 0x%08" PRIX32 ".", m_pCore->getCoreId(), address);
    return clearComparator(comparatorAddress);
}

uint32_t HardwareWatchpoints::calculateFunctionValue(uint32_t size, PlatformWatchpointType type)
{
    if (m_pCore->isArmV8M())
    {
        uint32_t match = DWT_FUNCTION_V8_DATA_READWRITE;
        if (type == MRI_PLATFORM_WRITE_WATCHPOINT)
        {
            match = DWT_FUNCTION_V8_DATA_WRITE;
        }
        else if (type == MRI_PLATFORM_READ_WATCHPOINT)
        {
            match = DWT_FUNCTION_V8_DATA_READ;
        }
        return match | DWT_FUNCTION_V8_ACTION_DEBUG_EVENT | (calculateLog2(size) << DWT_FUNCTION_V8_DATAVSIZE_Shift);
    }

    switch (type)
    {
    case MRI_PLATFORM_WRITE_WATCHPOINT:
        return DWT_FUNCTION_V7_DATA_WRITE;
    case MRI_PLATFORM_READ_WATCHPOINT:
        return DWT_FUNCTION_V7_DATA_READ;
    default:
        return DWT_FUNCTION_V7_DATA_READWRITE;
    }
}

bool HardwareWatchpoints::isValidSetting(uint32_t address, uint32_t size, PlatformWatchpointType type)
{
    if (type != MRI_PLATFORM_WRITE_WATCHPOINT &&
        type != MRI_PLATFORM_READ_WATCHPOINT &&
        type != MRI_PLATFORM_READWRITE_WATCHPOINT)
    {
        return false;
    }
    if (size == 0 || !isPowerOf2(size) || !isAddressAlignedToSize(address, size))
    {
        return false;
    }
    // DATAVSIZE can only describe byte, halfword and word accesses.
    if (m_pCore->isArmV8M() && size > 4)
    {
        return false;
    }
    return true;
}

bool HardwareWatchpoints::isPowerOf2(uint32_t value)
{
    return (value & (value - 1)) == 0;
}

bool HardwareWatchpoints::isAddressAlignedToSize(uint32_t address, uint32_t size)
{
    uint32_t addressMask = ~(size - 1);
    return address == (address & addressMask);
}

uint32_t HardwareWatchpoints::calculateLog2(uint32_t value)
{
    uint32_t log2 = 0;

    while (value > 1)
    {
        value >>= 1;
        log2++;
    }

    return log2;
}

bool HardwareWatchpoints::findComparator(uint32_t address, uint32_t size, uint32_t function,
                                         uint32_t* pComparatorAddress)
{
    uint32_t currentComparatorAddress = CpuCore::DWT_COMP0_Address;
    uint32_t comparatorCount = 0;
    if (!getComparatorCount(&comparatorCount))
    {
        return false;
    }
    for (uint32_t i = 0 ; i < comparatorCount ; i++)
    {
        bool isMatch = false;
        if (!doesComparatorMatch(currentComparatorAddress, address, size, function, &isMatch))
        {
            return false;
        }
        if (isMatch)
        {
            *pComparatorAddress = currentComparatorAddress;
            return true;
        }
        currentComparatorAddress += sizeof(DWT_COMP_Type);
    }

    // No DWT comparator is already enabled for this watchpoint.
    *pComparatorAddress = 0;
    return true;
}

bool HardwareWatchpoints::doesComparatorMatch(uint32_t comparatorAddress, uint32_t address, uint32_t size,
                                              uint32_t function, bool* pIsMatch)
{
    uint32_t functionValue = 0;
    uint32_t compValue = 0;
    if (!m_pCore->read32(comparatorAddress + offsetof(DWT_COMP_Type, function), &functionValue) ||
        !m_pCore->read32(comparatorAddress + offsetof(DWT_COMP_Type, comp), &compValue))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DWT comparator registers.", m_pCore->getCoreId());
        return setError(m_pCore->getLastError().code, "findComparator");
    }

    if (m_pCore->isArmV8M())
    {
        const uint32_t importantBits = DWT_FUNCTION_FUNCTION_Mask |
                                       DWT_FUNCTION_V8_ACTION_Mask |
                                       DWT_FUNCTION_V8_DATAVSIZE_Mask;
        *pIsMatch = (functionValue & importantBits) == function && compValue == address;
        return true;
    }

    uint32_t maskValue = 0;
    if (!m_pCore->read32(comparatorAddress + offsetof(DWT_COMP_Type, mask), &maskValue))
    {
        logErrorF("Core%" PRIu32 ": Failed to read DWT mask register.", m_pCore->getCoreId());
        return setError(m_pCore->getLastError().code, "findComparator");
    }
    *pIsMatch = (functionValue & DWT_FUNCTION_FUNCTION_Mask) == function &&
                compValue == address &&
                maskValue == calculateLog2(size);
    return true;
}

bool HardwareWatchpoints::findFreeComparator(uint32_t* pComparatorAddress)
{
    uint32_t currentComparatorAddress = CpuCore::DWT_COMP0_Address;
    uint32_t comparatorCount = 0;
    if (!getComparatorCount(&comparatorCount))
    {
        return false;
    }
    for (uint32_t i = 0 ; i < comparatorCount ; i++)
    {
        uint32_t functionValue = 0;
        if (!m_pCore->read32(currentComparatorAddress + offsetof(DWT_COMP_Type, function), &functionValue))
        {
            logErrorF("Core%" PRIu32 ": Failed to read DWT function register.", m_pCore->getCoreId());
            return setError(m_pCore->getLastError().code, "findFreeComparator");
        }
        if ((functionValue & DWT_FUNCTION_FUNCTION_Mask) == 0)
        {
            *pComparatorAddress = currentComparatorAddress;
            return true;
        }
        currentComparatorAddress += sizeof(DWT_COMP_Type);
    }

    // There are no free DWT comparators.
    *pComparatorAddress = 0;
    return true;
}

bool HardwareWatchpoints::attemptToSetComparator(uint32_t comparatorAddress, uint32_t address, uint32_t size,
                                                 uint32_t function)
{
    if (!m_pCore->isArmV8M())
    {
        uint32_t maskBitCount = calculateLog2(size);
        uint32_t maskValue = 0;
        if (!m_pCore->write32(comparatorAddress + offsetof(DWT_COMP_Type, mask), maskBitCount) ||
            !m_pCore->read32(comparatorAddress + offsetof(DWT_COMP_Type, mask), &maskValue))
        {
            logErrorF("Core%" PRIu32 ": Failed to set DWT mask register.", m_pCore->getCoreId());
            return setError(m_pCore->getLastError().code, "setWatchpoint");
        }
        // Processor may limit number of bits to be masked off so check.
        if (maskValue != maskBitCount)
        {
            return setError(ERROR_INVALID_ARGUMENT, "setWatchpoint");
        }
    }

    if (!m_pCore->write32(comparatorAddress + offsetof(DWT_COMP_Type, comp), address) ||
        !m_pCore->write32(comparatorAddress + offsetof(DWT_COMP_Type, function), function))
    {
        logErrorF("Core%" PRIu32 ": Failed to write DWT comparator/function registers.", m_pCore->getCoreId());
        return setError(m_pCore->getLastError().code, "setWatchpoint");
    }
    return true;
}

bool HardwareWatchpoints::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation, m_pCore->getCoreId());
    return false;
}
