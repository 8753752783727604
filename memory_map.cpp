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
// Description of the target device's memory regions.
#include "memory_map.h"


bool MemoryRegion::containsRange(uint32_t addr, uint32_t size) const
{
    if (size == 0)
    {
        return containsAddress(addr);
    }
    // Reject ranges which wrap around the end of the 32-bit address space.
    uint32_t lastAddress = addr + size - 1;
    if (lastAddress < addr)
    {
        return false;
    }
    return containsAddress(addr) && containsAddress(lastAddress);
}

bool MemoryMap::addRegion(const MemoryRegion& region)
{
    if (region.length == 0)
    {
        return false;
    }
    for (size_t i = 0 ; i < m_regions.size() ; i++)
    {
        const MemoryRegion& existing = m_regions[i];
        if (region.address <= existing.getEndAddress() && existing.address <= region.getEndAddress())
        {
            return false;
        }
    }
    m_regions.push_back(region);
    return true;
}

const MemoryRegion* MemoryMap::getRegionForAddress(uint32_t address) const
{
    for (size_t i = 0 ; i < m_regions.size() ; i++)
    {
        if (m_regions[i].containsAddress(address))
        {
            return &m_regions[i];
        }
    }
    return NULL;
}

const MemoryRegion* MemoryMap::getRegionForRange(uint32_t address, uint32_t size) const
{
    const MemoryRegion* pRegion = getRegionForAddress(address);
    if (pRegion == NULL || !pRegion->containsRange(address, size))
    {
        return NULL;
    }
    return pRegion;
}

const MemoryRegion* MemoryMap::getRegionByName(const std::string& name) const
{
    for (size_t i = 0 ; i < m_regions.size() ; i++)
    {
        if (m_regions[i].name == name)
        {
            return &m_regions[i];
        }
    }
    return NULL;
}

const MemoryRegion* MemoryMap::getBootMemory() const
{
    for (size_t i = 0 ; i < m_regions.size() ; i++)
    {
        if (m_regions[i].isBootMemory)
        {
            return &m_regions[i];
        }
    }
    return NULL;
}
