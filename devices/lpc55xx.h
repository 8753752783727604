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
// Support for the NXP LPC55xx family of Cortex-M33 microcontrollers.
//
// These devices differ from a generic CoreSight target in a few ways:
// * Reading erased flash results in a bus fault so core 0 reads memory through a FlashAwareMemory layer.
// * The boot ROM runs before the user's reset handler so DEMCR.VC_CORERESET can't be used to catch a reset. The
//   ResetCatch class is used instead.
// * The debug mailbox access port (AP2) can become wedged after a reset while the flash is erased so it is
//   resynchronized before discovery and after such resets.
// * AP1 must be used for non-secure transfers and the trace clock needs to be enabled before the trace components
//   can be used.
#ifndef LPC55XX_H_
#define LPC55XX_H_

#include <memory>
#include "cpu_core.h"
#include "debug_mailbox.h"
#include "flash_aware_memory.h"
#include "reset_catch.h"
#include "target.h"


// Core 0 of a LPC55xx device.
class Lpc55xxCore : public CpuCore
{
public:
    // The caller retains ownership of all of the objects passed in.
    Lpc55xxCore(Session* pSession, DebugProbe* pProbe, AccessPort* pAP, FlashAwareMemory* pMemory,
                const MemoryMap* pMemoryMap, uint32_t coreId, DebugMailbox* pMailbox);

    virtual bool setResetCatch(ResetType type = RESET_DEFAULT);
    virtual bool clearResetCatch(ResetType type = RESET_DEFAULT);

    ResetCatch* getResetCatch()
    {
        return &m_resetCatch;
    }
    FlashAwareMemory* getFlashAwareMemory()
    {
        return m_pFlashMemory;
    }

protected:
    FlashAwareMemory*   m_pFlashMemory;
    ResetCatch          m_resetCatch;
};


class Lpc55xxFamily : public CoreSightTarget
{
public:
    // Registers used to configure the trace clock.
    static const uint32_t TRACECLKSEL_Address = 0x40000268;
    static const uint32_t TRACECLKDIV_Address = 0x40000308;
    static const uint32_t AHBCLKCTRLSET0_Address = 0x40001220;
    // IOCON register for PIO0_10 which can be used as the SWO pin.
    static const uint32_t IOCON_PIO0_10_Address = 0x40001028;

    Lpc55xxFamily(Session* pSession, DebugProbe* pProbe, const MemoryMap& memoryMap);
    virtual ~Lpc55xxFamily();

    // Edits the generic bring-up sequence:
    //  discovery
    //      resynchronize_dm_ap     (inserted)
    //      find_aps
    //      create_aps
    //      find_components
    //          set_ap1_nonsec      (inserted before init_ap.1 when AP1 exists)
    //          init_ap.<n>
    //      create_cores            (replaced with LPC55xx core creation)
    //      enable_traceclk         (inserted)
    //      create_components
    virtual bool createInitSequence(TaskPipeline* pSequence);

    // Route PIO0_10 to the SWO function, give the trace_start hook the chance to configure trace, and then make sure
    // that the trace clock is running.
    bool traceStart(uint32_t mode = 0);

    DebugMailbox* getDebugMailbox()
    {
        return &m_mailbox;
    }

protected:
    ErrorCode resynchronizeDebugMailbox();
    ErrorCode setAP1NonSecure();
    ErrorCode createLpc55xxCores();
    ErrorCode enableTraceClock();

    DebugMailbox                        m_mailbox;
    std::unique_ptr<FlashAwareMemory>   m_pFlashMemory;
};

#endif // LPC55XX_H_
