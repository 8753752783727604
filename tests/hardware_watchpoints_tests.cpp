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
#include <gtest/gtest.h>
#include <memory>

#include "cpu_core.h"
#include "simulated_probe.h"


class HardwareWatchpointsTest : public ::testing::Test
{
protected:
    HardwareWatchpointsTest()
    : m_ap(&m_probe, 0), m_pMemory(m_probe.getSimulatedMemory(0))
    {
        m_pCore.reset(new CpuCore(&m_session, &m_probe, &m_ap, m_pMemory, &m_memoryMap, 0));
    }

    void setupCore(uint32_t cpuid, uint32_t comparatorCount)
    {
        m_pMemory->setWord(0xE000ED00, cpuid);
        m_pMemory->setWord(0xE0001000, comparatorCount << 28);
    }

    BreakpointManager* watchpoints()
    {
        return m_pCore->getBreakpointManager();
    }

    SimulatedProbe              m_probe;
    Session                     m_session;
    MemoryMap                   m_memoryMap;
    AccessPort                  m_ap;
    SimulatedMemory*            m_pMemory;
    std::unique_ptr<CpuCore>    m_pCore;
};

// Cortex-M4 and Cortex-M33 CPUID values.
static const uint32_t CPUID_CORTEX_M4 = 0x410FC241;
static const uint32_t CPUID_CORTEX_M33 = 0x410FD213;


TEST_F(HardwareWatchpointsTest, ArmV7MReadWriteWatchpointUsesMask)
{
    setupCore(CPUID_CORTEX_M4, 4);

    EXPECT_TRUE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(0x50000040U, m_pMemory->getWord(0xE0001020));
    EXPECT_EQ(2U, m_pMemory->getWord(0xE0001024));
    EXPECT_EQ(7U, m_pMemory->getWord(0xE0001028));
}

TEST_F(HardwareWatchpointsTest, ArmV7MReadAndWriteFunctions)
{
    setupCore(CPUID_CORTEX_M4, 4);

    EXPECT_TRUE(watchpoints()->setWatchpoint(0x20000000, 1, MRI_PLATFORM_READ_WATCHPOINT));
    EXPECT_TRUE(watchpoints()->setWatchpoint(0x20000010, 16, MRI_PLATFORM_WRITE_WATCHPOINT));

    EXPECT_EQ(5U, m_pMemory->getWord(0xE0001028));
    EXPECT_EQ(0U, m_pMemory->getWord(0xE0001024));
    EXPECT_EQ(0x20000010U, m_pMemory->getWord(0xE0001030));
    EXPECT_EQ(4U, m_pMemory->getWord(0xE0001034));
    EXPECT_EQ(6U, m_pMemory->getWord(0xE0001038));
}

TEST_F(HardwareWatchpointsTest, ArmV8MEncodesMatchActionAndSize)
{
    setupCore(CPUID_CORTEX_M33, 4);

    EXPECT_TRUE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(0x50000040U, m_pMemory->getWord(0xE0001020));
    EXPECT_EQ(0x814U, m_pMemory->getWord(0xE0001028));
    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE0001024));
}

TEST_F(HardwareWatchpointsTest, ArmV8MWriteWatchpointOnHalfword)
{
    setupCore(CPUID_CORTEX_M33, 4);

    EXPECT_TRUE(watchpoints()->setWatchpoint(0x20000002, 2, MRI_PLATFORM_WRITE_WATCHPOINT));

    // MATCH=5, ACTION=1, DATAVSIZE=1
    EXPECT_EQ(0x415U, m_pMemory->getWord(0xE0001028));
}

TEST_F(HardwareWatchpointsTest, SettingSameWatchpointTwiceUsesOneComparator)
{
    setupCore(CPUID_CORTEX_M33, 4);

    EXPECT_TRUE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));
    EXPECT_TRUE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(1U, m_pMemory->getWriteCount(0xE0001028));
    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE0001038));
}

TEST_F(HardwareWatchpointsTest, NoFreeComparator)
{
    setupCore(CPUID_CORTEX_M33, 1);
    m_pMemory->setWord(0xE0001020, 0x20000000);
    m_pMemory->setWord(0xE0001028, 0x816);

    EXPECT_FALSE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(ERROR_NO_FREE_COMPARATOR, watchpoints()->getLastError().code);
    EXPECT_EQ(0x20000000U, m_pMemory->getWord(0xE0001020));
}

TEST_F(HardwareWatchpointsTest, InvalidSettingsAreRejected)
{
    setupCore(CPUID_CORTEX_M33, 4);

    EXPECT_FALSE(watchpoints()->setWatchpoint(0x50000040, 3, MRI_PLATFORM_READWRITE_WATCHPOINT));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, watchpoints()->getLastError().code);
    EXPECT_FALSE(watchpoints()->setWatchpoint(0x50000042, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, watchpoints()->getLastError().code);
    EXPECT_FALSE(watchpoints()->setWatchpoint(0x50000040, 8, MRI_PLATFORM_READWRITE_WATCHPOINT));
    EXPECT_EQ(ERROR_INVALID_ARGUMENT, watchpoints()->getLastError().code);
    EXPECT_TRUE(m_pMemory->getWrites().empty());
}

TEST_F(HardwareWatchpointsTest, MaskLimitedByProcessorIsRejected)
{
    setupCore(CPUID_CORTEX_M4, 4);
    m_pMemory->queueReads(0xE0001024, { 0 });

    EXPECT_FALSE(watchpoints()->setWatchpoint(0x20000000, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(ERROR_INVALID_ARGUMENT, watchpoints()->getLastError().code);
    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE0001028));
}

TEST_F(HardwareWatchpointsTest, ClearFreesComparator)
{
    setupCore(CPUID_CORTEX_M33, 4);
    ASSERT_TRUE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_TRUE(watchpoints()->clearWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(0U, m_pMemory->getWord(0xE0001028));
    EXPECT_EQ(0U, m_pMemory->getWord(0xE0001020));
}

TEST_F(HardwareWatchpointsTest, ClearOfUnsetWatchpointSucceeds)
{
    setupCore(CPUID_CORTEX_M4, 4);

    EXPECT_TRUE(watchpoints()->clearWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));
    EXPECT_TRUE(m_pMemory->getWrites().empty());
}

TEST_F(HardwareWatchpointsTest, InitForDebuggingClearsComparators)
{
    setupCore(CPUID_CORTEX_M4, 2);
    m_pMemory->setWord(0xE0001028, 7);
    m_pMemory->setWord(0xE0001038, 5);

    EXPECT_TRUE(m_pCore->initForDebugging());

    EXPECT_EQ(0U, m_pMemory->getWord(0xE0001028));
    EXPECT_EQ(0U, m_pMemory->getWord(0xE0001038));
    EXPECT_EQ(1U, m_pMemory->getWriteCount(0xE0001024));
    // TRCENA and the vector catches were enabled along with halting debug.
    EXPECT_EQ(0x01000500U, m_pMemory->getWord(0xE000EDFC));
    EXPECT_EQ(0xA05F0001U, m_pMemory->getWord(0xE000EDF0));
}

TEST_F(HardwareWatchpointsTest, ComparatorReadFailureIsReportedAsTransportError)
{
    setupCore(CPUID_CORTEX_M33, 4);
    m_pMemory->queueReadErrors(0xE0001028, ERROR_TRANSPORT);

    EXPECT_FALSE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(ERROR_TRANSPORT, watchpoints()->getLastError().code);
    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE0001020));
}

TEST_F(HardwareWatchpointsTest, DWTCtrlReadFailureIsReported)
{
    setupCore(CPUID_CORTEX_M33, 4);
    m_pMemory->queueReadErrors(0xE0001000, ERROR_TRANSFER_FAULT);

    EXPECT_FALSE(watchpoints()->setWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(ERROR_TRANSFER_FAULT, watchpoints()->getLastError().code);
}

TEST_F(HardwareWatchpointsTest, ClearReportsComparatorReadFailure)
{
    setupCore(CPUID_CORTEX_M4, 4);
    m_pMemory->queueReadErrors(0xE0001028, ERROR_TRANSFER_TIMEOUT);

    EXPECT_FALSE(watchpoints()->clearWatchpoint(0x50000040, 4, MRI_PLATFORM_READWRITE_WATCHPOINT));

    EXPECT_EQ(ERROR_TRANSFER_TIMEOUT, watchpoints()->getLastError().code);
}
