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
// Generic CoreSight target. It owns the debug port, the memory map, and the cores of a device and knows how to bring
// them up through a TaskPipeline which device families can edit.
#ifndef TARGET_H_
#define TARGET_H_

#include <memory>
#include <vector>
#include "access_port.h"
#include "cpu_core.h"
#include "errors.h"
#include "memory_map.h"
#include "session.h"
#include "task_pipeline.h"
#include "transport.h"


class CoreSightTarget
{
public:
    // The caller retains ownership of pSession and pProbe. The memory map is copied.
    CoreSightTarget(Session* pSession, DebugProbe* pProbe, const MemoryMap& memoryMap);
    virtual ~CoreSightTarget();

    // Build the bring-up pipeline. The generic sequence is:
    //  dp_init
    //  discovery
    //      find_aps
    //      create_aps
    //      find_components (generates init_ap.<n> for each known access port)
    //      create_cores
    //      create_components
    //  halt_on_connect
    //  post_connect
    // Device families override this to edit the generic sequence after calling the base implementation.
    //
    // Returns true if successful.
    // Returns false if an edit failed and pSequence->getLastError() indicates why.
    virtual bool createInitSequence(TaskPipeline* pSequence);

    // Build and then execute the bring-up pipeline.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why and in which step.
    bool connect();

    size_t getCoreCount() const
    {
        return m_cores.size();
    }
    // Returns NULL if there is no such core.
    CpuCore* getCore(uint32_t coreId);

    // Reset and reset catch requests are directed at core 0.
    bool reset(ResetType type = RESET_DEFAULT);
    bool setResetCatch(ResetType type = RESET_DEFAULT);
    bool clearResetCatch(ResetType type = RESET_DEFAULT);

    DebugPort* getDebugPort()
    {
        return &m_debugPort;
    }
    Session* getSession()
    {
        return m_pSession;
    }
    const MemoryMap* getMemoryMap() const
    {
        return &m_memoryMap;
    }

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    // Generic pipeline steps.
    ErrorCode initDebugPort();
    ErrorCode findAPs();
    ErrorCode createAPs();
    ErrorCode findComponents(TaskPipeline& generated);
    ErrorCode initAP(uint32_t apIndex);
    ErrorCode createCores();
    ErrorCode createComponents();
    ErrorCode haltOnConnect();
    ErrorCode postConnect();

    // Takes ownership of pCore.
    void addCore(CpuCore* pCore);
    bool setErrorFromCore(CpuCore* pCore);
    bool setError(ErrorCode code, const char* pOperation);

    Session*                                m_pSession;
    DebugProbe*                             m_pProbe;
    DebugPort                               m_debugPort;
    MemoryMap                               m_memoryMap;
    std::vector<std::unique_ptr<CpuCore>>   m_cores;
    ErrorInfo                               m_lastError;
};

#endif // TARGET_H_
