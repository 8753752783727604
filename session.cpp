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
// Per debug session state: options, observers, hooks and cancellation.
#include <algorithm>
#define TARGET_MODULE "session.cpp"
#include "logging.h"
#include "session.h"


const char* resetTypeName(ResetType type)
{
    switch (type)
    {
    case RESET_DEFAULT:
        return "default";
    case RESET_HW:
        return "hw";
    case RESET_SW_SYSRESETREQ:
        return "sw_sysresetreq";
    case RESET_SW_VECTRESET:
        return "sw_vectreset";
    case RESET_SW_EMULATED:
        return "sw_emulated";
    default:
        return "unknown";
    }
}


Session::Session()
: m_isCancelled(false)
{
}

void Session::subscribe(SessionObserver* pObserver)
{
    if (std::find(m_observers.begin(), m_observers.end(), pObserver) != m_observers.end())
    {
        return;
    }
    m_observers.push_back(pObserver);
}

void Session::unsubscribe(SessionObserver* pObserver)
{
    m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), pObserver), m_observers.end());
}

void Session::notify(SessionEvent event, CpuCore* pCore)
{
    logDebugF("Notifying %u observers of %s.", (unsigned int)m_observers.size(),
              event == EVENT_PRE_RESET ? "PRE_RESET" : "POST_RESET");

    // Observers may unsubscribe from within their handler so iterate over a copy.
    std::vector<SessionObserver*> observers = m_observers;
    for (size_t i = 0 ; i < observers.size() ; i++)
    {
        observers[i]->onSessionEvent(event, pCore);
    }
}
