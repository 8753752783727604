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
// Support for the NXP LPC5516 (256k flash, 96k SRAM) member of the LPC55xx family.

// **********************************************************************************************************
// **** DEVICE_MODULE must be set to reflect the filename of this source file before including logging.h ****
// **********************************************************************************************************
#define DEVICE_MODULE "devices/lpc5516.cpp"
#include "logging.h"
#include "lpc5516.h"


// LPC5516 FLASH memory location.
static const uint32_t FLASH_START_ADDRESS = 0x00000000;
static const uint32_t FLASH_SIZE = 0x3D000;
static const uint32_t FLASH_PAGE_SIZE = 0x200;

// Flash algorithm is loaded at the start of SRAM.
static const uint32_t ALGO_LOAD_ADDRESS = 0x20000000;


const FlashAlgorithm Lpc5516::s_flashAlgorithm =
{
    ALGO_LOAD_ADDRESS,                          // loadAddress
    0x20000021,                                 // pcInit
    0x2000007D,                                 // pcUnInit
    0x200000D1,                                 // pcProgramPage
    0x200000A9,                                 // pcEraseSector
    0x20000081,                                 // pcEraseAll
    ALGO_LOAD_ADDRESS + 0x00000020 + 0x00000250,// staticBase
    0x20000500,                                 // beginStack
    ALGO_LOAD_ADDRESS + 0x1000,                 // beginData
    FLASH_PAGE_SIZE,                            // pageSize
    { 0x20001000, 0x20001200 },                 // pageBuffers (double buffered)
    FLASH_PAGE_SIZE,                            // minProgramLength
    FLASH_START_ADDRESS,                        // flashStart
    FLASH_SIZE,                                 // flashSize
    { { 0x0, 0x8000 } }                         // sectorSizes
};


static MemoryRegion createRegion(const char* pName, MemoryType type, uint32_t address, uint32_t length,
                                 uint32_t access)
{
    MemoryRegion region;
    region.name = pName;
    region.type = type;
    region.address = address;
    region.length = length;
    region.access = access;
    return region;
}

MemoryMap Lpc5516::createMemoryMap()
{
    MemoryMap memoryMap;

    MemoryRegion flash = createRegion("nsflash", MEMORY_FLASH, FLASH_START_ADDRESS, FLASH_SIZE, MEMORY_ACCESS_RX);
    flash.blockSize = FLASH_PAGE_SIZE;
    flash.isBootMemory = true;
    flash.areErasedSectorsReadable = false;
    flash.pAlgorithm = &s_flashAlgorithm;

    MemoryRegion codeRam = createRegion("nscoderam", MEMORY_RAM, 0x04000000, 0x00004000, MEMORY_ACCESS_RWX);
    codeRam.isDefault = false;

    bool result = memoryMap.addRegion(flash) &&
                  memoryMap.addRegion(createRegion("nsrom", MEMORY_ROM, 0x03000000, 0x00020000, MEMORY_ACCESS_RX)) &&
                  memoryMap.addRegion(codeRam) &&
                  memoryMap.addRegion(createRegion("nsram", MEMORY_RAM, 0x20000000, 0x00010000, MEMORY_ACCESS_RWX)) &&
                  memoryMap.addRegion(createRegion("usbram", MEMORY_RAM, 0x20010000, 0x00004000, MEMORY_ACCESS_RWX));
    if (!result)
    {
        logError("Failed to build LPC5516 memory map.");
    }
    return memoryMap;
}

Lpc5516::Lpc5516(Session* pSession, DebugProbe* pProbe)
: Lpc55xxFamily(pSession, pProbe, createMemoryMap())
{
}
