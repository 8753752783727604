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
// Generic CoreSight target.
#define TARGET_MODULE "target.cpp"
#include "logging.h"
#include "target.h"


CoreSightTarget::CoreSightTarget(Session* pSession, DebugProbe* pProbe, const MemoryMap& memoryMap)
: m_pSession(pSession), m_pProbe(pProbe), m_debugPort(pProbe), m_memoryMap(memoryMap)
{
}

CoreSightTarget::~CoreSightTarget()
{
}

bool CoreSightTarget::createInitSequence(TaskPipeline* pSequence)
{
    TaskPipeline discovery;
    bool result = discovery.append("find_aps", [this]() { return findAPs(); }) &&
                  discovery.append("create_aps", [this]() { return createAPs(); }) &&
                  discovery.appendGenerator("find_components", [this](TaskPipeline& generated) { return findComponents(generated); }) &&
                  discovery.append("create_cores", [this]() { return createCores(); }) &&
                  discovery.append("create_components", [this]() { return createComponents(); });
    if (!result)
    {
        return false;
    }

    return pSequence->append("dp_init", [this]() { return initDebugPort(); }) &&
           pSequence->appendNested("discovery", discovery) &&
           pSequence->append("halt_on_connect", [this]() { return haltOnConnect(); }) &&
           pSequence->append("post_connect", [this]() { return postConnect(); });
}

bool CoreSightTarget::connect()
{
    m_lastError = ErrorInfo();
    m_cores.clear();

    TaskPipeline sequence;
    if (!createInitSequence(&sequence))
    {
        m_lastError = sequence.getLastError();
        logErrorF("Failed to build the bring-up sequence (%s at '%s').",
                  errorCodeName(m_lastError.code), m_lastError.step.c_str());
        return false;
    }
    if (!sequence.execute())
    {
        m_lastError = sequence.getLastError();
        logErrorF("Bring-up failed in step '%s' (%s).", m_lastError.step.c_str(), errorCodeName(m_lastError.code));
        return false;
    }
    logInfoF("Connected to target with %u core(s).", (unsigned int)m_cores.size());
    return true;
}

CpuCore* CoreSightTarget::getCore(uint32_t coreId)
{
    if (coreId >= m_cores.size())
    {
        return NULL;
    }
    return m_cores[coreId].get();
}

bool CoreSightTarget::reset(ResetType type)
{
    CpuCore* pCore = getCore(0);
    if (pCore == NULL)
    {
        return setError(ERROR_AP_NOT_FOUND, "reset");
    }
    if (!pCore->reset(type))
    {
        return setErrorFromCore(pCore);
    }
    return true;
}

bool CoreSightTarget::setResetCatch(ResetType type)
{
    CpuCore* pCore = getCore(0);
    if (pCore == NULL)
    {
        return setError(ERROR_AP_NOT_FOUND, "setResetCatch");
    }
    if (!pCore->setResetCatch(type))
    {
        return setErrorFromCore(pCore);
    }
    return true;
}

bool CoreSightTarget::clearResetCatch(ResetType type)
{
    CpuCore* pCore = getCore(0);
    if (pCore == NULL)
    {
        return setError(ERROR_AP_NOT_FOUND, "clearResetCatch");
    }
    if (!pCore->clearResetCatch(type))
    {
        return setErrorFromCore(pCore);
    }
    return true;
}


ErrorCode CoreSightTarget::initDebugPort()
{
    if (!m_debugPort.init())
    {
        return m_debugPort.getLastError().code;
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::findAPs()
{
    if (!m_debugPort.findAPs(MAX_AP_COUNT))
    {
        return m_debugPort.getLastError().code;
    }
    logDebugF("Found %u access port(s).", (unsigned int)m_debugPort.getFoundAPIndices().size());
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::createAPs()
{
    if (!m_debugPort.createFoundAPs())
    {
        return m_debugPort.getLastError().code;
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::findComponents(TaskPipeline& generated)
{
    std::vector<uint32_t> indices = m_debugPort.getAPIndices();
    for (size_t i = 0 ; i < indices.size() ; i++)
    {
        uint32_t apIndex = indices[i];
        if (!generated.append("init_ap." + std::to_string(apIndex), [this, apIndex]() { return initAP(apIndex); }))
        {
            return generated.getLastError().code;
        }
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::initAP(uint32_t apIndex)
{
    AccessPort* pAP = m_debugPort.getAP(apIndex);
    if (pAP == NULL)
    {
        return ERROR_AP_NOT_FOUND;
    }
    if (!pAP->init())
    {
        return pAP->getLastError().code;
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::createCores()
{
    std::vector<uint32_t> indices = m_debugPort.getAPIndices();
    for (size_t i = 0 ; i < indices.size() ; i++)
    {
        AccessPort* pAP = m_debugPort.getAP(indices[i]);
        if (!pAP->isMemAP())
        {
            continue;
        }

        TargetMemory* pMemory = m_pProbe->getMemory(pAP->getIndex());
        if (pMemory == NULL)
        {
            logErrorF("Probe has no memory interface for AP%" PRIu32 ".", pAP->getIndex());
            return ERROR_AP_NOT_FOUND;
        }
        uint32_t coreId = (uint32_t)m_cores.size();
        logDebugF("Creating Core%" PRIu32 " on AP%" PRIu32 ".", coreId, pAP->getIndex());
        addCore(new CpuCore(m_pSession, m_pProbe, pAP, pMemory, &m_memoryMap, coreId));
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::createComponents()
{
    for (size_t i = 0 ; i < m_cores.size() ; i++)
    {
        CpuCore* pCore = m_cores[i].get();
        if (!pCore->initForDebugging())
        {
            logErrorF("Core%" PRIu32 ": Failed to initialize for debugging.", pCore->getCoreId());
            return pCore->getLastError().code;
        }
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::haltOnConnect()
{
    if (!m_pSession->getOptions().haltOnConnect)
    {
        return ERROR_NONE;
    }

    for (size_t i = 0 ; i < m_cores.size() ; i++)
    {
        CpuCore* pCore = m_cores[i].get();
        if (!pCore->halt() || !pCore->waitForCoreToHalt(READ_DHCSR_TIMEOUT_MS))
        {
            logErrorF("Core%" PRIu32 ": Failed to halt on connect.", pCore->getCoreId());
            return pCore->getLastError().code;
        }
    }
    return ERROR_NONE;
}

ErrorCode CoreSightTarget::postConnect()
{
    if (m_cores.empty())
    {
        logError("No cores were found on the target.");
    }
    return ERROR_NONE;
}

void CoreSightTarget::addCore(CpuCore* pCore)
{
    m_cores.push_back(std::unique_ptr<CpuCore>(pCore));
}

bool CoreSightTarget::setErrorFromCore(CpuCore* pCore)
{
    m_lastError = pCore->getLastError();
    return false;
}

bool CoreSightTarget::setError(ErrorCode code, const char* pOperation)
{
    m_lastError = ErrorInfo(code, pOperation);
    return false;
}
