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
// Orchestrates the reset of a core: notifications, override hooks, the reset itself, optional recovery of debug
// logic which the reset may have wedged, and waiting for the core to leave reset.
#ifndef RESET_SEQUENCER_H_
#define RESET_SEQUENCER_H_

#include "errors.h"
#include "session.h"


// Device families can provide an object implementing this interface to bring their debug logic back to a usable
// state after a reset. It is only called when the core's flash was found to be erased by the last reset catch.
class ResetRecovery
{
public:
    virtual ~ResetRecovery() {}

    // Returns ERROR_NONE if successful.
    virtual ErrorCode recoverAfterReset(CpuCore* pCore) = 0;
};


class ResetSequencer
{
public:
    ResetSequencer(CpuCore* pCore);

    // The caller retains ownership of pRecovery. NULL disables recovery.
    void setRecovery(ResetRecovery* pRecovery)
    {
        m_pRecovery = pRecovery;
    }

    // Should the core be explicitly halted once the reset has been asserted (and any recovery completed)?
    void setHaltAfterReset(bool haltAfterReset)
    {
        m_haltAfterReset = haltAfterReset;
    }

    // Reset the core. The sequence is:
    //  1. Notify observers with EVENT_PRE_RESET.
    //  2. Increment the core's run token.
    //  3. Give the will_reset hook the chance to perform the reset, otherwise assert the reset mechanism.
    //  4. Run the recovery object if the core's flash was erased at the last reset catch.
    //  5. Halt the core if enabled with setHaltAfterReset().
    //  6. Call the did_reset hook.
    //  7. Poll DHCSR until S_RESET_ST is clear. Faults are retried after flushing the transport. Fails with
    //     ERROR_RESET_TIMEOUT if the core hasn't left reset within SessionOptions::resetExitTimeoutMs.
    //  8. Notify observers with EVENT_POST_RESET.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why. EVENT_POST_RESET isn't sent on failure.
    bool reset(ResetType type);

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    bool waitForResetExit();
    bool setError(ErrorCode code, const char* pOperation);
    bool setErrorFromCore(const char* pOperation);

    CpuCore*        m_pCore;
    ResetRecovery*  m_pRecovery;
    ErrorInfo       m_lastError;
    bool            m_haltAfterReset;
};

#endif // RESET_SEQUENCER_H_
