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
// Reset catch for devices which can't use DEMCR.VC_CORERESET because their boot ROM runs first.
//
// If the flash contains a valid reset vector then FPB comparator 0 is used to break on the first instruction of the
// user's reset handler. If the flash is erased then there is no user code to break on so a read/write watchpoint is
// placed on the address that the boot ROM writes once it has finished instead.
#ifndef RESET_CATCH_H_
#define RESET_CATCH_H_

#include "errors.h"
#include "session.h"


enum ResetCatchMode
{
    RESET_CATCH_NONE = 0,
    RESET_CATCH_BREAKPOINT = 1,
    RESET_CATCH_WATCHPOINT = 2
};


class ResetCatch
{
public:
    // Address written by the boot ROM of LPC55xx devices once it is done.
    static const uint32_t BOOTROM_MAGIC_Address = 0x50000040;
    // Address of the reset vector in the vector table at the start of flash.
    static const uint32_t RESET_VECTOR_Address = 0x00000004;
    // Value read back from erased flash.
    static const uint32_t ERASED_FLASH_WORD = 0xFFFFFFFF;

    ResetCatch(CpuCore* pCore);

    // Arm the core to halt after the next reset. The set_reset_catch hook is given the first chance to handle it.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why. The mode is left as RESET_CATCH_NONE.
    bool set(ResetType type);

    // Disarm whichever comparator set() armed and restore the DEMCR value saved by set(). The clear_reset_catch
    // hook is always called but the disarm is only skipped if the set_reset_catch hook handled the activation.
    bool clear(ResetType type);

    ResetCatchMode getMode() const
    {
        return m_mode;
    }
    bool wasHandledByHook() const
    {
        return m_wasHandledByHook;
    }
    uint32_t getSavedDEMCR() const
    {
        return m_savedDEMCR;
    }

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    bool armBreakpoint(uint32_t resetVector);
    bool armWatchpoint();
    bool disarm();
    void restoreDEMCR();
    bool setError(ErrorCode code, const char* pOperation);
    bool setErrorFromCore(const char* pOperation);

    CpuCore*        m_pCore;
    ErrorInfo       m_lastError;
    uint32_t        m_savedDEMCR;
    ResetCatchMode  m_mode;
    bool            m_hasSavedDEMCR;
    bool            m_wasHandledByHook;
};

#endif // RESET_CATCH_H_
