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
// Interfaces to the debug probe which are implemented outside of swd-bringup: access port register transfers, raw
// memory transfers through a MEM-AP, the nRESET pin, and breakpoint/watchpoint management.
#ifndef TRANSPORT_H_
#define TRANSPORT_H_

#include <stdint.h>
#include "errors.h"

// MRI C headers
extern "C"
{
    #include <core/platforms.h>
}


// Size of each individual transfer used for reading/writing target memory.
enum TransferSize
{
    TRANSFER_8BIT = 8,
    TRANSFER_16BIT = 16,
    TRANSFER_32BIT = 32
};


// Register level access to the access ports behind the probe's debug port.
class ApRegisterClient
{
public:
    virtual ~ApRegisterClient() {}

    // Power up the debug port and clear any sticky errors so that the access ports can be used.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastReadWriteError() indicates why.
    virtual bool initDebugPort() = 0;

    // Read a 32-bit register from an access port.
    //
    // apIndex - Index (APSEL) of the access port to be read.
    // offset - Byte offset of the register within the access port (ie. 0xFC for the IDR).
    // pData - Pointer to 32-bit buffer to be populated by this read.
    //
    // Returns true if the read was successful.
    // Returns false otherwise and getLastReadWriteError() indicates why.
    virtual bool readAP(uint32_t apIndex, uint32_t offset, uint32_t* pData) = 0;

    // Write a 32-bit register in an access port.
    //
    // Returns true if the write was successful.
    // Returns false otherwise and getLastReadWriteError() indicates why.
    virtual bool writeAP(uint32_t apIndex, uint32_t offset, uint32_t data) = 0;

    // Fetch the cause of the last read or write call which has failed. Will be one of the transport errors:
    // ERROR_TRANSFER_FAULT, ERROR_TRANSFER_TIMEOUT, or ERROR_TRANSPORT.
    virtual ErrorCode getLastReadWriteError() = 0;
};


// Raw access to target memory through a single MEM-AP.
class TargetMemory
{
public:
    virtual ~TargetMemory() {}

    // Read from the requested memory range.
    //
    // Returns the number of bytes actually read. Anything less than bufferSize indicates a failure and
    // getLastReadWriteError() indicates why.
    virtual uint32_t readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize) = 0;

    // Write to the requested memory range.
    //
    // Returns the number of bytes actually written. Anything less than bufferSize indicates a failure and
    // getLastReadWriteError() indicates why.
    virtual uint32_t writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize, TransferSize writeSize) = 0;

    // Fetch the cause of the last read or write call which has failed.
    virtual ErrorCode getLastReadWriteError() = 0;

    // Flush any queued transfers and clear sticky error state in the transport.
    virtual void flush() = 0;
};


// The debug probe itself.
class DebugProbe : public ApRegisterClient
{
public:
    // Fetch the raw memory interface for the MEM-AP at apIndex. The probe owns the returned object and it stays valid
    // for the lifetime of the probe.
    //
    // Returns NULL if the probe can't issue memory transfers through that access port.
    virtual TargetMemory* getMemory(uint32_t apIndex) = 0;

    // Drive the target's nRESET pin. asserted is true to pull the pin low and hold the device in reset.
    //
    // Returns true if successful.
    // Returns false if the probe has no control over nRESET or the operation failed.
    virtual bool setResetPin(bool asserted) = 0;
};


// Breakpoint/watchpoint bookkeeping for a single core.
class BreakpointManager
{
public:
    virtual ~BreakpointManager() {}

    // Set a watchpoint (read and/or write) at the specified memory range.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why.
    virtual bool setWatchpoint(uint32_t address, uint32_t size, PlatformWatchpointType type) = 0;

    // Clear a watchpoint previously set with setWatchpoint().
    //
    // Returns true if successful (or if no such watchpoint was set).
    // Returns false otherwise and getLastError() indicates why.
    virtual bool clearWatchpoint(uint32_t address, uint32_t size, PlatformWatchpointType type) = 0;

    // Filter data read from memory so that any software breakpoint instructions placed by the manager are replaced
    // with the original contents of memory.
    virtual void filterMemory(uint32_t address, uint8_t* pData, uint32_t size) = 0;

    virtual ErrorInfo getLastError() = 0;
};

#endif // TRANSPORT_H_
