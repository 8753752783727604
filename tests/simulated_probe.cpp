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
// Simulated debug probe used by the unit tests.
#include "simulated_probe.h"


SimulatedMemory::SimulatedMemory()
: m_lastError(ERROR_NONE), m_faultStart(0), m_faultLength(0), m_flushCount(0)
{
}

void SimulatedMemory::setWord(uint32_t address, uint32_t value)
{
    m_words[address & ~3] = value;
}

uint32_t SimulatedMemory::getWord(uint32_t address) const
{
    std::map<uint32_t, uint32_t>::const_iterator it = m_words.find(address & ~3);
    if (it == m_words.end())
    {
        return 0;
    }
    return it->second;
}

void SimulatedMemory::queueReads(uint32_t address, const std::vector<uint32_t>& values)
{
    m_queuedReads[address] = std::deque<uint32_t>(values.begin(), values.end());
}

void SimulatedMemory::queueReadErrors(uint32_t address, ErrorCode error, uint32_t count)
{
    for (uint32_t i = 0 ; i < count ; i++)
    {
        m_readErrors[address].push_back(error);
    }
}

void SimulatedMemory::queueWriteError(uint32_t address, ErrorCode error)
{
    m_writeErrors[address] = error;
}

void SimulatedMemory::setFaultRange(uint32_t start, uint32_t length)
{
    m_faultStart = start;
    m_faultLength = length;
}

void SimulatedMemory::clearFaultRange()
{
    m_faultStart = 0;
    m_faultLength = 0;
}

uint32_t SimulatedMemory::getReadCount(uint32_t address) const
{
    std::map<uint32_t, uint32_t>::const_iterator it = m_readCounts.find(address);
    if (it == m_readCounts.end())
    {
        return 0;
    }
    return it->second;
}

bool SimulatedMemory::wasRangeRead(uint32_t start, uint32_t length) const
{
    for (size_t i = 0 ; i < m_reads.size() ; i++)
    {
        const SimulatedRead& read = m_reads[i];
        if (read.address < start + length && start < read.address + read.length)
        {
            return true;
        }
    }
    return false;
}

size_t SimulatedMemory::getWriteCount(uint32_t address) const
{
    size_t count = 0;
    for (size_t i = 0 ; i < m_writes.size() ; i++)
    {
        if (m_writes[i].address == address)
        {
            count++;
        }
    }
    return count;
}

bool SimulatedMemory::getLastWrite(uint32_t address, uint32_t* pValue) const
{
    for (size_t i = m_writes.size() ; i > 0 ; i--)
    {
        if (m_writes[i - 1].address == address)
        {
            *pValue = m_writes[i - 1].value;
            return true;
        }
    }
    return false;
}

int SimulatedMemory::findWrite(uint32_t address, uint32_t value) const
{
    for (size_t i = 0 ; i < m_writes.size() ; i++)
    {
        if (m_writes[i].address == address && m_writes[i].value == value)
        {
            return (int)i;
        }
    }
    return -1;
}

void SimulatedMemory::clearLog()
{
    m_reads.clear();
    m_writes.clear();
    m_readCounts.clear();
}

uint32_t SimulatedMemory::readMemory(uint32_t address, void* pvBuffer, uint32_t bufferSize, TransferSize readSize)
{
    uint8_t* pBuffer = (uint8_t*)pvBuffer;
    uint32_t unitSize = readSize / 8;

    m_reads.push_back({ address, bufferSize });
    if (isInFaultRange(address, bufferSize))
    {
        m_lastError = ERROR_TRANSFER_FAULT;
        return 0;
    }

    for (uint32_t offset = 0 ; offset < bufferSize ; offset += unitSize)
    {
        uint32_t currentAddress = address + offset;
        if (readSize == TRANSFER_32BIT && (currentAddress & 3) == 0)
        {
            uint32_t value = 0;
            if (!readWord(currentAddress, &value))
            {
                return offset;
            }
            for (uint32_t i = 0 ; i < 4 && offset + i < bufferSize ; i++)
            {
                pBuffer[offset + i] = (uint8_t)(value >> (8 * i));
            }
            continue;
        }

        for (uint32_t i = 0 ; i < unitSize && offset + i < bufferSize ; i++)
        {
            if (!readByte(currentAddress + i, &pBuffer[offset + i]))
            {
                return offset;
            }
        }
    }
    return bufferSize;
}

uint32_t SimulatedMemory::writeMemory(uint32_t address, const void* pvBuffer, uint32_t bufferSize, TransferSize writeSize)
{
    const uint8_t* pBuffer = (const uint8_t*)pvBuffer;
    uint32_t unitSize = writeSize / 8;

    for (uint32_t offset = 0 ; offset < bufferSize ; offset += unitSize)
    {
        uint32_t value = 0;
        for (uint32_t i = 0 ; i < unitSize && offset + i < bufferSize ; i++)
        {
            value |= (uint32_t)pBuffer[offset + i] << (8 * i);
        }
        uint32_t byteMask = (unitSize == 4) ? 0xFFFFFFFF : ((1U << (8 * unitSize)) - 1);
        if (!writeWord(address + offset, value, byteMask, writeSize))
        {
            return offset;
        }
    }
    return bufferSize;
}

bool SimulatedMemory::readWord(uint32_t address, uint32_t* pValue)
{
    m_readCounts[address]++;

    std::map<uint32_t, std::deque<ErrorCode>>::iterator errorIt = m_readErrors.find(address);
    if (errorIt != m_readErrors.end() && !errorIt->second.empty())
    {
        m_lastError = errorIt->second.front();
        errorIt->second.pop_front();
        return false;
    }

    std::map<uint32_t, std::deque<uint32_t>>::iterator queueIt = m_queuedReads.find(address);
    if (queueIt != m_queuedReads.end() && !queueIt->second.empty())
    {
        *pValue = queueIt->second.front();
        if (queueIt->second.size() > 1)
        {
            queueIt->second.pop_front();
        }
        return true;
    }

    *pValue = getWord(address);
    return true;
}

bool SimulatedMemory::readByte(uint32_t address, uint8_t* pValue)
{
    m_readCounts[address]++;
    *pValue = (uint8_t)(getWord(address) >> (8 * (address & 3)));
    return true;
}

bool SimulatedMemory::writeWord(uint32_t address, uint32_t value, uint32_t byteMask, TransferSize size)
{
    std::map<uint32_t, ErrorCode>::iterator errorIt = m_writeErrors.find(address);
    if (errorIt != m_writeErrors.end())
    {
        m_lastError = errorIt->second;
        m_writeErrors.erase(errorIt);
        return false;
    }

    m_writes.push_back({ address, value, size });

    uint32_t shift = 8 * (address & 3);
    uint32_t mask = byteMask << shift;
    uint32_t wordAddress = address & ~3;
    m_words[wordAddress] = (getWord(wordAddress) & ~mask) | ((value << shift) & mask);
    return true;
}

bool SimulatedMemory::isInFaultRange(uint32_t address, uint32_t length) const
{
    if (m_faultLength == 0)
    {
        return false;
    }
    return address < m_faultStart + m_faultLength && m_faultStart < address + length;
}



SimulatedProbe::SimulatedProbe()
: m_lastError(ERROR_NONE), m_initError(ERROR_NONE), m_initCount(0), m_isResetPinSupported(true)
{
}

void SimulatedProbe::setAPRegister(uint32_t apIndex, uint32_t offset, uint32_t value)
{
    queueAPReads(apIndex, offset, { value });
}

void SimulatedProbe::queueAPReads(uint32_t apIndex, uint32_t offset, const std::vector<uint32_t>& values)
{
    m_apRegisters[RegisterKey(apIndex, offset)] = std::deque<uint32_t>(values.begin(), values.end());
}

void SimulatedProbe::queueAPReadErrors(uint32_t apIndex, uint32_t offset, ErrorCode error, uint32_t count)
{
    for (uint32_t i = 0 ; i < count ; i++)
    {
        m_apReadErrors[RegisterKey(apIndex, offset)].push_back(error);
    }
}

void SimulatedProbe::queueAPWriteError(uint32_t apIndex, uint32_t offset, ErrorCode error)
{
    m_apWriteErrors[RegisterKey(apIndex, offset)] = error;
}

void SimulatedProbe::setAPs(const std::vector<uint32_t>& idrs)
{
    for (size_t i = 0 ; i < idrs.size() ; i++)
    {
        setAPRegister((uint32_t)i, 0xFC, idrs[i]);
    }
}

uint32_t SimulatedProbe::getAPReadCount(uint32_t apIndex, uint32_t offset) const
{
    std::map<RegisterKey, uint32_t>::const_iterator it = m_apReadCounts.find(RegisterKey(apIndex, offset));
    if (it == m_apReadCounts.end())
    {
        return 0;
    }
    return it->second;
}

int SimulatedProbe::findAPWrite(uint32_t apIndex, uint32_t offset, uint32_t value) const
{
    for (size_t i = 0 ; i < m_apWrites.size() ; i++)
    {
        const SimulatedApWrite& write = m_apWrites[i];
        if (write.apIndex == apIndex && write.offset == offset && write.value == value)
        {
            return (int)i;
        }
    }
    return -1;
}

SimulatedMemory* SimulatedProbe::getSimulatedMemory(uint32_t apIndex)
{
    std::unique_ptr<SimulatedMemory>& pMemory = m_memories[apIndex];
    if (!pMemory)
    {
        pMemory.reset(new SimulatedMemory());
    }
    return pMemory.get();
}

bool SimulatedProbe::initDebugPort()
{
    m_initCount++;
    if (m_initError != ERROR_NONE)
    {
        m_lastError = m_initError;
        return false;
    }
    return true;
}

bool SimulatedProbe::readAP(uint32_t apIndex, uint32_t offset, uint32_t* pData)
{
    RegisterKey key(apIndex, offset);
    m_apReadCounts[key]++;

    std::map<RegisterKey, std::deque<ErrorCode>>::iterator errorIt = m_apReadErrors.find(key);
    if (errorIt != m_apReadErrors.end() && !errorIt->second.empty())
    {
        m_lastError = errorIt->second.front();
        errorIt->second.pop_front();
        return false;
    }

    *pData = 0;
    std::map<RegisterKey, std::deque<uint32_t>>::iterator it = m_apRegisters.find(key);
    if (it != m_apRegisters.end() && !it->second.empty())
    {
        *pData = it->second.front();
        if (it->second.size() > 1)
        {
            it->second.pop_front();
        }
    }
    return true;
}

bool SimulatedProbe::writeAP(uint32_t apIndex, uint32_t offset, uint32_t data)
{
    RegisterKey key(apIndex, offset);
    std::map<RegisterKey, ErrorCode>::iterator errorIt = m_apWriteErrors.find(key);
    if (errorIt != m_apWriteErrors.end())
    {
        m_lastError = errorIt->second;
        m_apWriteErrors.erase(errorIt);
        return false;
    }

    m_apWrites.push_back({ apIndex, offset, data });
    return true;
}

bool SimulatedProbe::setResetPin(bool asserted)
{
    if (!m_isResetPinSupported)
    {
        m_lastError = ERROR_TRANSPORT;
        return false;
    }
    m_resetPinStates.push_back(asserted);
    return true;
}
