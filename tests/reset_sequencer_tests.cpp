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
#include "reset_sequencer.h"
#include "fakes.h"
#include "simulated_probe.h"


// DHCSR values seen while the core is still in reset and once it has left reset.
static const uint32_t DHCSR_IN_RESET = 0x02030001;
static const uint32_t DHCSR_OUT_OF_RESET = 0x00030001;


class RecordingRecovery : public ResetRecovery
{
public:
    RecordingRecovery(std::vector<std::string>* pLog)
    : pEventLog(pLog), result(ERROR_NONE)
    {
    }

    virtual ErrorCode recoverAfterReset(CpuCore* pCore)
    {
        pEventLog->push_back("recover");
        return result;
    }

    std::vector<std::string>*   pEventLog;
    ErrorCode                   result;
};


class ResetSequencerTest : public ::testing::Test
{
protected:
    ResetSequencerTest()
    : m_ap(&m_probe, 0), m_pMemory(m_probe.getSimulatedMemory(0)), m_hooks(&m_events), m_observer(&m_events),
      m_recovery(&m_events)
    {
        m_pCore.reset(new CpuCore(&m_session, &m_probe, &m_ap, m_pMemory, &m_memoryMap, 0));
    }

    virtual void SetUp()
    {
        m_session.getOptions().resetExitTimeoutMs = 20;
        m_session.getOptions().resetRetryDelayMs = 0;
        m_session.getOptions().hardwareResetPulseMs = 1;
        m_session.subscribe(&m_observer);
        m_hooks.install(&m_session.getHooks());
        m_pMemory->queueReads(0xE000EDF0, { DHCSR_IN_RESET, DHCSR_OUT_OF_RESET });
    }

    ResetSequencer* sequencer()
    {
        return m_pCore->getResetSequencer();
    }

    SimulatedProbe              m_probe;
    Session                     m_session;
    MemoryMap                   m_memoryMap;
    AccessPort                  m_ap;
    SimulatedMemory*            m_pMemory;
    std::vector<std::string>    m_events;
    FakeHooks                   m_hooks;
    RecordingObserver           m_observer;
    RecordingRecovery           m_recovery;
    std::unique_ptr<CpuCore>    m_pCore;
};


TEST_F(ResetSequencerTest, EventsAreDeliveredInOrder)
{
    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset", "did_reset", "post_reset" }), m_events);
    EXPECT_EQ(m_pCore.get(), m_observer.pLastCore);
    EXPECT_EQ(1U, m_pCore->getRunToken());
}

TEST_F(ResetSequencerTest, SysResetReqWritesAIRCRWithKey)
{
    m_pMemory->setWord(0xE000ED0C, 0xFA050000);

    EXPECT_TRUE(m_pCore->reset(RESET_SW_SYSRESETREQ));

    uint32_t value = 0;
    ASSERT_TRUE(m_pMemory->getLastWrite(0xE000ED0C, &value));
    EXPECT_EQ(0x05FA0004U, value);
    EXPECT_EQ(RESET_SW_SYSRESETREQ, m_hooks.lastResetType);
}

TEST_F(ResetSequencerTest, SessionResetTypeOverridesCoreDefault)
{
    m_session.getOptions().resetType = RESET_HW;

    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ(RESET_HW, m_hooks.lastResetType);
    EXPECT_EQ((std::vector<bool>{ true, false }), m_probe.getResetPinStates());
    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE000ED0C));
}

TEST_F(ResetSequencerTest, MissingResetPinFailsHardwareReset)
{
    m_probe.setResetPinSupported(false);

    EXPECT_FALSE(m_pCore->reset(RESET_HW));

    EXPECT_EQ(ERROR_TRANSPORT, m_pCore->getLastError().code);
    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset" }), m_events);
}

TEST_F(ResetSequencerTest, WillResetHookCanPerformReset)
{
    m_hooks.willResetResult = true;

    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE000ED0C));
    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset", "did_reset", "post_reset" }), m_events);
}

TEST_F(ResetSequencerTest, UnacknowledgedAIRCRWriteIsNotAFailure)
{
    m_pMemory->queueWriteError(0xE000ED0C, ERROR_TRANSFER_TIMEOUT);

    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ(1U, m_pMemory->getFlushCount());
}

TEST_F(ResetSequencerTest, FaultingAIRCRWriteFails)
{
    m_pMemory->queueWriteError(0xE000ED0C, ERROR_TRANSFER_FAULT);

    EXPECT_FALSE(m_pCore->reset());

    EXPECT_EQ(ERROR_TRANSFER_FAULT, m_pCore->getLastError().code);
}

TEST_F(ResetSequencerTest, AIRCRWriteTransportErrorFails)
{
    m_pMemory->queueWriteError(0xE000ED0C, ERROR_TRANSPORT);

    EXPECT_FALSE(m_pCore->reset());

    EXPECT_EQ(ERROR_TRANSPORT, m_pCore->getLastError().code);
    EXPECT_EQ(0U, m_pMemory->getFlushCount());
}

TEST_F(ResetSequencerTest, PerformResetFailsOnAIRCRTransportError)
{
    m_pMemory->queueWriteError(0xE000ED0C, ERROR_TRANSPORT);

    EXPECT_FALSE(m_pCore->performReset(RESET_SW_SYSRESETREQ));
}

TEST_F(ResetSequencerTest, RecoveryRunsBeforeDidResetWhenFlashErased)
{
    sequencer()->setRecovery(&m_recovery);
    sequencer()->setHaltAfterReset(true);
    m_pCore->setFlashErased(true);
    m_hooks.onDidReset = [this]()
    {
        // The core was halted after recovery and before did_reset.
        uint32_t DHCSR_Write = 0;
        EXPECT_TRUE(m_pMemory->getLastWrite(0xE000EDF0, &DHCSR_Write));
        EXPECT_EQ(0xA05F0003U, DHCSR_Write);
    };

    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset", "recover", "did_reset", "post_reset" }), m_events);
}

TEST_F(ResetSequencerTest, RecoveryIsSkippedWhenFlashProgrammed)
{
    sequencer()->setRecovery(&m_recovery);
    m_pCore->setFlashErased(false);

    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset", "did_reset", "post_reset" }), m_events);
}

TEST_F(ResetSequencerTest, RecoveryFailureStopsReset)
{
    sequencer()->setRecovery(&m_recovery);
    m_recovery.result = ERROR_SESSION_TIMEOUT;

    EXPECT_FALSE(m_pCore->reset());

    EXPECT_EQ(ERROR_SESSION_TIMEOUT, m_pCore->getLastError().code);
    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset", "recover" }), m_events);
}

TEST_F(ResetSequencerTest, CoreThatNeverLeavesResetTimesOut)
{
    m_pMemory->queueReads(0xE000EDF0, { DHCSR_IN_RESET });

    EXPECT_FALSE(m_pCore->reset());

    EXPECT_EQ(ERROR_RESET_TIMEOUT, m_pCore->getLastError().code);
    EXPECT_EQ(0, m_pCore->getLastError().index);
    EXPECT_EQ((std::vector<std::string>{ "pre_reset", "will_reset", "did_reset" }), m_events);
}

TEST_F(ResetSequencerTest, FaultsWhileLeavingResetAreRetriedAfterFlush)
{
    m_pMemory->queueReads(0xE000EDF0, { DHCSR_OUT_OF_RESET });
    m_pMemory->queueReadErrors(0xE000EDF0, ERROR_TRANSFER_FAULT, 3);

    EXPECT_TRUE(m_pCore->reset());

    EXPECT_EQ(3U, m_pMemory->getFlushCount());
    EXPECT_EQ(4U, m_pMemory->getReadCount(0xE000EDF0));
}

TEST_F(ResetSequencerTest, OtherErrorsWhileLeavingResetFail)
{
    m_pMemory->queueReadErrors(0xE000EDF0, ERROR_TRANSPORT);

    EXPECT_FALSE(m_pCore->reset());

    EXPECT_EQ(ERROR_TRANSPORT, m_pCore->getLastError().code);
    EXPECT_EQ(0U, m_pMemory->getFlushCount());
}

TEST_F(ResetSequencerTest, CancelStopsWaitForResetExit)
{
    m_pMemory->queueReads(0xE000EDF0, { DHCSR_IN_RESET });
    m_hooks.onDidReset = [this]() { m_session.cancel(); };

    EXPECT_FALSE(m_pCore->reset());

    EXPECT_EQ(ERROR_CANCELLED, m_pCore->getLastError().code);
}

TEST_F(ResetSequencerTest, VectResetIsEmulatedOnArmV8M)
{
    // Cortex-M33 that is halted with the register transfer ready.
    m_pMemory->setWord(0xE000ED00, 0x410FD213);
    m_pMemory->queueReads(0xE000EDF0, { 0x00030001 });
    m_pMemory->setWord(0xE000ED08, 0x00000000);
    m_pMemory->setWord(0x00000000, 0x20004000);
    m_pMemory->setWord(0x00000004, 0x00001001);

    EXPECT_TRUE(m_pCore->reset(RESET_SW_VECTRESET));

    EXPECT_EQ(0U, m_pMemory->getWriteCount(0xE000ED0C));
    // PC (register 15) is loaded last with the Thumb bit cleared.
    uint32_t value = 0;
    ASSERT_TRUE(m_pMemory->getLastWrite(0xE000EDF4, &value));
    EXPECT_EQ(0x0001000FU, value);
    ASSERT_TRUE(m_pMemory->getLastWrite(0xE000EDF8, &value));
    EXPECT_EQ(0x00001000U, value);
    // MSP (register 17) is loaded from the vector table.
    int mspIndex = m_pMemory->findWrite(0xE000EDF4, 0x00010011);
    ASSERT_NE(-1, mspIndex);
    EXPECT_EQ(0x20004000U, m_pMemory->getWrites()[mspIndex - 1].value);
}

TEST_F(ResetSequencerTest, VectResetUsesAIRCROnArmV7M)
{
    // Cortex-M4
    m_pMemory->setWord(0xE000ED00, 0x410FC241);

    EXPECT_TRUE(m_pCore->reset(RESET_SW_VECTRESET));

    uint32_t value = 0;
    ASSERT_TRUE(m_pMemory->getLastWrite(0xE000ED0C, &value));
    EXPECT_EQ(0x05FA0001U, value);
}
