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
// Description of the target device's memory regions (RAM, ROM, FLASH) and the flash algorithm used for its flash.
#ifndef MEMORY_MAP_H_
#define MEMORY_MAP_H_

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>


// Types of memory that can be defined in the device's memory map.
enum MemoryType
{
    MEMORY_RAM,
    MEMORY_ROM,
    MEMORY_FLASH
};

// Bits used for MemoryRegion::access.
enum MemoryAccess
{
    MEMORY_ACCESS_READ = 1 << 0,
    MEMORY_ACCESS_WRITE = 1 << 1,
    MEMORY_ACCESS_EXECUTE = 1 << 2
};
static const uint32_t MEMORY_ACCESS_RX = MEMORY_ACCESS_READ | MEMORY_ACCESS_EXECUTE;
static const uint32_t MEMORY_ACCESS_RWX = MEMORY_ACCESS_READ | MEMORY_ACCESS_WRITE | MEMORY_ACCESS_EXECUTE;


// Addresses of the routines and buffers used when a flash algorithm is loaded into target RAM. The algorithm
// instructions themselves aren't included since swd-bringup doesn't program flash. The geometry is used to locate
// flash controller words during erase detection.
struct FlashAlgorithm
{
    uint32_t loadAddress;
    uint32_t pcInit;
    uint32_t pcUnInit;
    uint32_t pcProgramPage;
    uint32_t pcEraseSector;
    uint32_t pcEraseAll;
    uint32_t staticBase;
    uint32_t beginStack;
    uint32_t beginData;
    uint32_t pageSize;
    std::vector<uint32_t> pageBuffers;
    uint32_t minProgramLength;
    uint32_t flashStart;
    uint32_t flashSize;
    // List of (start offset, sector size) pairs.
    std::vector<std::pair<uint32_t, uint32_t>> sectorSizes;
};


// Description of a region of device memory (RAM, ROM, FLASH): Starting address, size, etc.
struct MemoryRegion
{
    MemoryRegion()
    : address(0), length(0), access(MEMORY_ACCESS_RWX), type(MEMORY_RAM), blockSize(0),
      isBootMemory(false), areErasedSectorsReadable(true), isDefault(true), pAlgorithm(NULL)
    {
    }

    std::string name;
    // Starting address of this region.
    uint32_t address;
    // Number of bytes in this region.
    uint32_t length;
    // Combination of MEMORY_ACCESS_* bits.
    uint32_t access;
    MemoryType type;
    // Erase FLASH in blocks of this size.
    uint32_t blockSize;
    // Does the device boot from this region?
    bool isBootMemory;
    // Can erased flash sectors be read without a bus fault?
    bool areErasedSectorsReadable;
    // Is this region used by default for its memory type?
    bool isDefault;
    // Flash algorithm for this region. NULL for non-flash regions.
    const FlashAlgorithm* pAlgorithm;

    // Address of the last byte in the region.
    uint32_t getEndAddress() const
    {
        return address + length - 1;
    }
    bool isFlash() const
    {
        return type == MEMORY_FLASH;
    }
    bool containsAddress(uint32_t addr) const
    {
        return addr >= address && addr <= getEndAddress();
    }
    // Does this region cover the whole of [addr, addr + size)?
    bool containsRange(uint32_t addr, uint32_t size) const;
};


// Memory map of the device's various memory regions. Regions can't overlap.
class MemoryMap
{
public:
    MemoryMap()
    {
    }

    // Add a region to the map.
    //
    // Returns true if successful.
    // Returns false if the region is empty or overlaps an existing region.
    bool addRegion(const MemoryRegion& region);

    // Returns the region containing address or NULL if it isn't in any of the regions.
    const MemoryRegion* getRegionForAddress(uint32_t address) const;
    // Returns the region containing the whole of [address, address + size) or NULL if no single region does.
    const MemoryRegion* getRegionForRange(uint32_t address, uint32_t size) const;
    const MemoryRegion* getRegionByName(const std::string& name) const;
    // Returns the region marked as boot memory or NULL if there isn't one.
    const MemoryRegion* getBootMemory() const;

    size_t getRegionCount() const
    {
        return m_regions.size();
    }
    const MemoryRegion& getRegion(size_t index) const
    {
        return m_regions[index];
    }

protected:
    std::vector<MemoryRegion> m_regions;
};

#endif // MEMORY_MAP_H_
