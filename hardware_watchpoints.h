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
#ifndef HARDWARE_WATCHPOINTS_H_
#define HARDWARE_WATCHPOINTS_H_

#include "transport.h"

class CpuCore;


class HardwareWatchpoints : public BreakpointManager
{
public:
    HardwareWatchpoints(CpuCore* pCore);

    // Disable all of the DWT comparators.
    bool init();

    // Set a watchpoint (read and/or write) at the specified memory range.
    // Fails with ERROR_INVALID_ARGUMENT if the address, size, or type aren't supported by the DWT.
    // Fails with ERROR_NO_FREE_COMPARATOR if all of the watchpoint comparators are already in use.
    virtual bool setWatchpoint(uint32_t address, uint32_t size, PlatformWatchpointType type);

    // Clear a watchpoint (read and/or write) at the specified memory range.
    // Fails with ERROR_INVALID_ARGUMENT if the address, size, or type aren't supported by the DWT.
    virtual bool clearWatchpoint(uint32_t address, uint32_t size, PlatformWatchpointType type);

    // Hardware breakpoints don't modify memory so there is nothing to filter.
    virtual void filterMemory(uint32_t address, uint8_t* pData, uint32_t size)
    {
    }

    virtual ErrorInfo getLastError()
    {
        return m_lastError;
    }

protected:
    struct DWT_COMP_Type
    {
        uint32_t comp;
        uint32_t mask;
        uint32_t function;
        uint32_t padding;
    };

    bool getComparatorCount(uint32_t* pCount);
    bool clearComparator(uint32_t comparatorAddress);
    uint32_t calculateFunctionValue(uint32_t size, PlatformWatchpointType type);
    bool isValidSetting(uint32_t address, uint32_t size, PlatformWatchpointType type);
    static bool isPowerOf2(uint32_t value);
    static bool isAddressAlignedToSize(uint32_t address, uint32_t size);
    static uint32_t calculateLog2(uint32_t value);
    // The search functions return false if the DWT registers couldn't be read. Otherwise *pComparatorAddress is set
    // to the address of the found comparator or 0 if there isn't one.
    bool findComparator(uint32_t address, uint32_t size, uint32_t function, uint32_t* pComparatorAddress);
    bool doesComparatorMatch(uint32_t comparatorAddress, uint32_t address, uint32_t size, uint32_t function,
                             bool* pIsMatch);
    bool findFreeComparator(uint32_t* pComparatorAddress);
    bool attemptToSetComparator(uint32_t comparatorAddress, uint32_t address, uint32_t size, uint32_t function);
    bool setError(ErrorCode code, const char* pOperation);

    CpuCore*    m_pCore;
    ErrorInfo   m_lastError;
};

#endif // HARDWARE_WATCHPOINTS_H_
