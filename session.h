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
// Per debug session state shared by the target, its cores and the reset logic: options, observers of reset events,
// user supplied override hooks, and cancellation.
#ifndef SESSION_H_
#define SESSION_H_

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "config.h"

class CpuCore;
class CoreSightTarget;


// The mechanisms that can be used to reset a core.
enum ResetType
{
    // Use the type from the SessionOptions or, if that is also RESET_DEFAULT, the core's own default.
    RESET_DEFAULT = 0,
    // Pulse the nRESET pin.
    RESET_HW,
    // Set AIRCR.SYSRESETREQ to reset the whole device.
    RESET_SW_SYSRESETREQ,
    // Set AIRCR.VECTRESET to reset just the core. Only available on ARMv7-M.
    RESET_SW_VECTRESET,
    // Emulate a core reset by loading the registers with their reset values.
    RESET_SW_EMULATED
};

const char* resetTypeName(ResetType type);


// Events broadcast to SessionObserver objects.
enum SessionEvent
{
    EVENT_PRE_RESET,
    EVENT_POST_RESET
};

class SessionObserver
{
public:
    virtual ~SessionObserver() {}

    virtual void onSessionEvent(SessionEvent event, CpuCore* pCore) = 0;
};


// Override hooks. Each hook is optional and each one returns true if it fully handled the operation so that the
// default behaviour should be skipped. A NULL hook is treated as returning false.
//
// Called just before a core is reset. Return true if the hook performed the reset itself.
class WillResetHook
{
public:
    virtual ~WillResetHook() {}
    virtual bool willReset(CpuCore* pCore, ResetType type) = 0;
};

// Called once the core has been reset and halted.
class DidResetHook
{
public:
    virtual ~DidResetHook() {}
    virtual bool didReset(CpuCore* pCore, ResetType type) = 0;
};

// Called when arming the core to halt at the first instruction after reset. Return true if the hook armed it itself.
class SetResetCatchHook
{
public:
    virtual ~SetResetCatchHook() {}
    virtual bool setResetCatch(CpuCore* pCore, ResetType type) = 0;
};

// Called when disarming the reset catch. Return true if the hook disarmed it itself.
class ClearResetCatchHook
{
public:
    virtual ~ClearResetCatchHook() {}
    virtual bool clearResetCatch(CpuCore* pCore, ResetType type) = 0;
};

// Called when starting trace capture on the target. Return true if the hook configured trace itself.
class TraceStartHook
{
public:
    virtual ~TraceStartHook() {}
    virtual bool traceStart(CoreSightTarget* pTarget, uint32_t mode) = 0;
};

struct OverrideHooks
{
    OverrideHooks()
    : pWillReset(NULL), pDidReset(NULL), pSetResetCatch(NULL), pClearResetCatch(NULL), pTraceStart(NULL)
    {
    }

    WillResetHook*       pWillReset;
    DidResetHook*        pDidReset;
    SetResetCatchHook*   pSetResetCatch;
    ClearResetCatchHook* pClearResetCatch;
    TraceStartHook*      pTraceStart;
};


// Runtime options for a session. They start out with the defaults from config.h.
struct SessionOptions
{
    SessionOptions()
    : resetType(RESET_DEFAULT),
      sessionTimeoutMs(SESSION_TIMEOUT_MS),
      resetExitTimeoutMs(RESET_EXIT_TIMEOUT_MS),
      resetRetryDelayMs(RESET_RETRY_DELAY_MS),
      hardwareResetPulseMs(HARDWARE_RESET_PULSE_MS),
      flashProbeTimeoutMs(FLASH_PROBE_TIMEOUT_MS),
      flashProbePollIntervalMs(FLASH_PROBE_POLL_INTERVAL_MS),
      dmApPollIntervalUs(DM_AP_POLL_INTERVAL_US),
      haltOnConnect(HALT_ON_ATTACH)
    {
    }

    ResetType resetType;
    uint32_t  sessionTimeoutMs;
    uint32_t  resetExitTimeoutMs;
    uint32_t  resetRetryDelayMs;
    uint32_t  hardwareResetPulseMs;
    uint32_t  flashProbeTimeoutMs;
    uint32_t  flashProbePollIntervalMs;
    uint32_t  dmApPollIntervalUs;
    bool      haltOnConnect;
};


class Session
{
public:
    Session();

    SessionOptions& getOptions()
    {
        return m_options;
    }
    OverrideHooks& getHooks()
    {
        return m_hooks;
    }

    // Register/unregister an observer of the EVENT_* notifications. The caller retains ownership of the observer.
    void subscribe(SessionObserver* pObserver);
    void unsubscribe(SessionObserver* pObserver);
    void notify(SessionEvent event, CpuCore* pCore);

    // Ask any long running polls in this session to stop at their next iteration with ERROR_CANCELLED. Can be called
    // from another thread or interrupt context.
    void cancel()
    {
        m_isCancelled = true;
    }
    void clearCancel()
    {
        m_isCancelled = false;
    }
    bool isCancelled() const
    {
        return m_isCancelled;
    }

protected:
    SessionOptions                  m_options;
    OverrideHooks                   m_hooks;
    std::vector<SessionObserver*>   m_observers;
    volatile bool                   m_isCancelled;
};

#endif // SESSION_H_
