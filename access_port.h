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
#ifndef ACCESS_PORT_H_
#define ACCESS_PORT_H_

#include <map>
#include <memory>
#include <vector>
#include "errors.h"
#include "transport.h"


class AccessPort
{
public:
    AccessPort(ApRegisterClient* pClient, uint32_t index);

    // Offsets of registers common to all access ports.
    static const uint32_t CSW_Offset = 0x00;
    static const uint32_t IDR_Offset = 0xFC;

    uint32_t getIndex() const
    {
        return m_index;
    }

    // Read/write a register in this access port.
    //
    // Returns true if successful.
    // Returns false otherwise and getLastError() indicates why. Failures are only logged at the debug level since
    // several callers poll through expected errors.
    bool readRegister(uint32_t offset, uint32_t* pData);
    bool writeRegister(uint32_t offset, uint32_t data);

    // IDR value read during discovery. 0 if it hasn't been read yet.
    uint32_t getIDR() const
    {
        return m_idr;
    }
    void setIDR(uint32_t idr)
    {
        m_idr = idr;
    }

    // Is this a MEM-AP (IDR.CLASS == 0x8) which can be used for accessing memory on the target?
    bool isMemAP() const;

    // Select whether memory transfers through this MEM-AP should be non-secure (CSW.HNONSEC). Takes effect the next
    // time init() is called.
    void setNonSecure(bool nonSecure)
    {
        m_isNonSecure = nonSecure;
    }
    bool isNonSecure() const
    {
        return m_isNonSecure;
    }

    // Prepare the access port for use. For a MEM-AP this applies the HNONSEC setting to its CSW register. Nothing is
    // required for other types of access port.
    bool init();

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    ApRegisterClient*   m_pClient;
    uint32_t            m_index;
    uint32_t            m_idr;
    ErrorInfo           m_lastError;
    bool                m_isNonSecure;
};


class DebugPort
{
public:
    DebugPort(DebugProbe* pProbe);

    // Power up the debug port.
    bool init();

    // Probe the IDR of access ports starting at index 0 and stopping at the first one that is absent (IDR reads as
    // 0 or the read faults), or at maxCount. The indices of the found access ports can be fetched with
    // getFoundAPIndices().
    //
    // Returns true if successful.
    // Returns false if an unexpected transport error was encountered.
    bool findAPs(uint32_t maxCount);
    const std::vector<uint32_t>& getFoundAPIndices() const
    {
        return m_foundIndices;
    }

    // Create AccessPort objects for each of the access ports found by findAPs(), caching their IDR values.
    bool createFoundAPs();

    // Fetch the AccessPort object for index, creating it if it isn't already known. Doesn't access the hardware.
    AccessPort* getOrCreateAP(uint32_t index);

    // Returns NULL if there is no AccessPort object for index.
    AccessPort* getAP(uint32_t index);
    bool hasAP(uint32_t index) const
    {
        return m_aps.count(index) != 0;
    }
    std::vector<uint32_t> getAPIndices() const;

    DebugProbe* getProbe()
    {
        return m_pProbe;
    }

    const ErrorInfo& getLastError() const
    {
        return m_lastError;
    }

protected:
    DebugProbe*                                         m_pProbe;
    std::map<uint32_t, std::unique_ptr<AccessPort>>     m_aps;
    std::vector<uint32_t>                               m_foundIndices;
    std::vector<uint32_t>                               m_foundIDRs;
    ErrorInfo                                           m_lastError;
};

#endif // ACCESS_PORT_H_
