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
// AccessPort and DebugPort classes which track the access ports discovered behind the probe's debug port.
#define ACCESS_PORT_MODULE "access_port.cpp"
#include "logging.h"
#include "access_port.h"


AccessPort::AccessPort(ApRegisterClient* pClient, uint32_t index)
: m_pClient(pClient), m_index(index), m_idr(0), m_isNonSecure(false)
{
}

bool AccessPort::readRegister(uint32_t offset, uint32_t* pData)
{
    if (!m_pClient->readAP(m_index, offset, pData))
    {
        m_lastError = ErrorInfo(m_pClient->getLastReadWriteError(), "readAP", m_index);
        logDebugF("AP%" PRIu32 ": Failed to read register 0x%02" PRIX32 " (%s).",
                  m_index, offset, errorCodeName(m_lastError.code));
        return false;
    }
    return true;
}

bool AccessPort::writeRegister(uint32_t offset, uint32_t data)
{
    if (!m_pClient->writeAP(m_index, offset, data))
    {
        m_lastError = ErrorInfo(m_pClient->getLastReadWriteError(), "writeAP", m_index);
        logDebugF("AP%" PRIu32 ": Failed to write 0x%08" PRIX32 " to register 0x%02" PRIX32 " (%s).",
                  m_index, data, offset, errorCodeName(m_lastError.code));
        return false;
    }
    return true;
}

bool AccessPort::isMemAP() const
{
    const uint32_t IDR_CLASS_Shift = 13;
    const uint32_t IDR_CLASS_Mask = 0xF << IDR_CLASS_Shift;
    const uint32_t IDR_CLASS_MEM_AP = 0x8 << IDR_CLASS_Shift;

    return (m_idr & IDR_CLASS_Mask) == IDR_CLASS_MEM_AP;
}

bool AccessPort::init()
{
    if (!isMemAP())
    {
        return true;
    }

    // Bit 30 of the CSW is HPROT[6] on AHB5 MEM-APs which selects non-secure transfers.
    const uint32_t CSW_HNONSEC_Bit = 1 << 30;
    uint32_t CSW_Value = 0;
    if (!readRegister(CSW_Offset, &CSW_Value))
    {
        logErrorF("AP%" PRIu32 ": Failed to read CSW register.", m_index);
        return false;
    }
    if (m_isNonSecure)
    {
        CSW_Value |= CSW_HNONSEC_Bit;
    }
    else
    {
        CSW_Value &= ~CSW_HNONSEC_Bit;
    }
    if (!writeRegister(CSW_Offset, CSW_Value))
    {
        logErrorF("AP%" PRIu32 ": Failed to write CSW register.", m_index);
        return false;
    }
    return true;
}



DebugPort::DebugPort(DebugProbe* pProbe)
: m_pProbe(pProbe)
{
}

bool DebugPort::init()
{
    if (!m_pProbe->initDebugPort())
    {
        m_lastError = ErrorInfo(m_pProbe->getLastReadWriteError(), "initDebugPort");
        logErrorF("Failed to power up the debug port (%s).", errorCodeName(m_lastError.code));
        return false;
    }
    return true;
}

bool DebugPort::findAPs(uint32_t maxCount)
{
    m_foundIndices.clear();
    m_foundIDRs.clear();

    for (uint32_t i = 0 ; i < maxCount ; i++)
    {
        uint32_t idr = 0;
        if (!m_pProbe->readAP(i, AccessPort::IDR_Offset, &idr))
        {
            ErrorCode code = m_pProbe->getLastReadWriteError();
            if (code != ERROR_TRANSFER_FAULT)
            {
                m_lastError = ErrorInfo(code, "findAPs", i);
                logErrorF("Failed to read IDR of AP%" PRIu32 " (%s).", i, errorCodeName(code));
                return false;
            }
            logDebugF("Read of AP%" PRIu32 " IDR faulted so assuming no more APs.", i);
            break;
        }
        if (idr == 0)
        {
            break;
        }

        logDebugF("Found AP%" PRIu32 " with IDR=0x%08" PRIX32 ".", i, idr);
        m_foundIndices.push_back(i);
        m_foundIDRs.push_back(idr);
    }
    return true;
}

bool DebugPort::createFoundAPs()
{
    for (size_t i = 0 ; i < m_foundIndices.size() ; i++)
    {
        AccessPort* pAP = getOrCreateAP(m_foundIndices[i]);
        pAP->setIDR(m_foundIDRs[i]);
    }
    return true;
}

AccessPort* DebugPort::getOrCreateAP(uint32_t index)
{
    AccessPort* pAP = getAP(index);
    if (pAP != NULL)
    {
        return pAP;
    }

    std::unique_ptr<AccessPort> pNew(new AccessPort(m_pProbe, index));
    pAP = pNew.get();
    m_aps[index] = std::move(pNew);
    return pAP;
}

AccessPort* DebugPort::getAP(uint32_t index)
{
    std::map<uint32_t, std::unique_ptr<AccessPort>>::iterator it = m_aps.find(index);
    if (it == m_aps.end())
    {
        return NULL;
    }
    return it->second.get();
}

std::vector<uint32_t> DebugPort::getAPIndices() const
{
    std::vector<uint32_t> indices;
    for (std::map<uint32_t, std::unique_ptr<AccessPort>>::const_iterator it = m_aps.begin() ; it != m_aps.end() ; ++it)
    {
        indices.push_back(it->first);
    }
    return indices;
}
