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
// Driver for the debug mailbox access port (DM-AP) found on NXP LPC55xx devices. The DM-AP can end up wedged after
// a reset while the flash is erased and must be resynchronized before a new debug session can be started.
#ifndef DEBUG_MAILBOX_H_
#define DEBUG_MAILBOX_H_

#include "access_port.h"
#include "reset_sequencer.h"
#include "session.h"


class DebugMailbox : public ResetRecovery
{
public:
    // The DM-AP is always found at this access port index.
    static const uint32_t DM_AP_Index = 2;

    // DM-AP registers.
    static const uint32_t CSW_Offset = 0x00;
    static const uint32_t REQUEST_Offset = 0x04;
    static const uint32_t RETURN_Offset = 0x08;
    static const uint32_t IDR_Offset = 0xFC;

    // IDR value of a DM-AP that is ready to accept requests.
    static const uint32_t IDR_VALUE = 0x002A0000;
    // CSW bits.
    static const uint32_t CSW_RESYNCH_REQ_Bit = 1 << 0;
    static const uint32_t CSW_CHIP_RESET_REQ_Bit = 1 << 5;
    // Request code which starts a debug session.
    static const uint32_t START_DEBUG_SESSION = 0x07;
    // Only the low halfword of RETURN holds the status of the last request.
    static const uint32_t RETURN_STATUS_Mask = 0xFFFF;

    DebugMailbox(DebugPort* pDebugPort, Session* pSession);

    // Bring the DM-AP back to a known state and start a debug session:
    //  1. Fetch the DM-AP object, creating it if it isn't already known.
    //  2. Poll the IDR until it reads IDR_VALUE. Faults are retried.
    //  3. Write RESYNCH_REQ | CHIP_RESET_REQ to the CSW.
    //  4. Poll the CSW until it reads 0. Transfer timeouts are retried.
    //  5. Run startDebugSession().
    // Any other transport error fails immediately. The polls in steps 2 and 4 are only bounded by the session
    // timeout (SessionOptions::sessionTimeoutMs which defaults to none) and cancellation of the session.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why.
    bool resynchronize();

    // Write START_DEBUG_SESSION to the REQUEST register and poll RETURN until its status reads 0. Transfer timeouts
    // are retried.
    bool startDebugSession();

    // ResetRecovery interface.
    virtual ErrorCode recoverAfterReset(CpuCore* pCore);

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    typedef bool (*PollPredicate)(uint32_t value);

    bool pollRegister(AccessPort* pAP, uint32_t offset, PollPredicate isDone, ErrorCode retryableError,
                      const char* pOperation);
    bool writeRegister(AccessPort* pAP, uint32_t offset, uint32_t value, const char* pOperation);
    bool setError(ErrorCode code, const char* pOperation);

    DebugPort*  m_pDebugPort;
    Session*    m_pSession;
    ErrorInfo   m_lastError;
};

#endif // DEBUG_MAILBOX_H_
