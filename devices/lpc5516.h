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
#ifndef LPC5516_H_
#define LPC5516_H_

#include "lpc55xx.h"


class Lpc5516 : public Lpc55xxFamily
{
public:
    Lpc5516(Session* pSession, DebugProbe* pProbe);

    // The memory map used by Lpc5516 objects.
    static MemoryMap createMemoryMap();

    // Addresses and geometry of the flash algorithm used for the nsflash region.
    static const FlashAlgorithm s_flashAlgorithm;
};

#endif // LPC5516_H_
