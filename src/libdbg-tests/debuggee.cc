#include "sdbg/dbg/debuggee.hh"
#include "sdbg/dbg/globals.hh"
#include "sdbg/dbg/tests/test-process.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/signals.hh"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sdbg {

using namespace sdbg::testing;

static std::unique_ptr<Debuggee> launch(const std::string & program)
{
    return Debuggee::create(DebuggeeConfig::SpawnChild{{program}});
}

TEST(Debuggee, launchProgram)
{
    auto debuggee = launch(programRunningEndlessly());
    auto pid = debuggee->pid();

    ASSERT_TRUE(processExists(pid));
    ASSERT_TRUE(debuggee->processState().isStopped());
    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Stopped{SIGTRAP}});
    ASSERT_NE(debuggee->registers(), nullptr);
}

TEST(Debuggee, launchNonexistentProgram)
{
    ASSERT_THROW(launch("this_program_doesnt_exist"), Error);
}

TEST(Debuggee, launchWithoutArguments)
{
    ASSERT_THROW(Debuggee::create(DebuggeeConfig::SpawnChild{{}}), Error);
}

TEST(Debuggee, spawnedProcessIsKilledOnDetach)
{
    pid_t pid;
    {
        auto debuggee = launch(programRunningEndlessly());
        pid = debuggee->pid();
    }

    ASSERT_FALSE(processExists(pid));
}

TEST(Debuggee, attachToProcess)
{
    TestProcess process({programRunningEndlessly()});
    auto debuggee = Debuggee::create(DebuggeeConfig::Existing{process.pid()});

    ASSERT_EQ(procState(process.pid()), 't');
    ASSERT_TRUE(debuggee->processState().isStopped());
    ASSERT_NE(debuggee->registers(), nullptr);
}

TEST(Debuggee, attachedProcessSurvivesDetach)
{
    TestProcess process({programRunningEndlessly()});
    Debuggee::create(DebuggeeConfig::Existing{process.pid()}).reset();

    ASSERT_TRUE(processExists(process.pid()));
    ASSERT_NE(procState(process.pid()), 't');
}

TEST(Debuggee, detachFromRunningAttachedProcess)
{
    TestProcess process({programRunningEndlessly()});
    auto debuggee = Debuggee::create(DebuggeeConfig::Existing{process.pid()});
    debuggee->resume();

    debuggee.reset();

    ASSERT_TRUE(processExists(process.pid()));
    auto state = procState(process.pid());
    ASSERT_TRUE(state == 'R' || state == 'S') << state;
}

TEST(Debuggee, attachToInvalidPid)
{
    ASSERT_THROW(Debuggee::create(DebuggeeConfig::Existing{-1}), SysError);
}

TEST(Debuggee, launchAndResumeProgramRunningEndlessly)
{
    auto debuggee = launch(programRunningEndlessly());
    debuggee->resume();

    auto state = procState(debuggee->pid());
    ASSERT_TRUE(state == 'R' || state == 'S') << state;
    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Running{}});
    ASSERT_EQ(debuggee->registers(), nullptr);

    debuggee->updateProcessState(false);
    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Running{}});
}

TEST(Debuggee, attachAndResumeProgramRunningEndlessly)
{
    TestProcess process({programRunningEndlessly()});
    auto debuggee = Debuggee::create(DebuggeeConfig::Existing{process.pid()});
    debuggee->resume();

    auto state = procState(process.pid());
    ASSERT_TRUE(state == 'R' || state == 'S') << state;
}

TEST(Debuggee, resumeAndStopAgain)
{
    auto debuggee = launch(programRunningEndlessly());
    debuggee->resume();

    ASSERT_EQ(kill(debuggee->pid(), SIGSTOP), 0);
    debuggee->updateProcessState(true);

    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Stopped{SIGSTOP}});
    ASSERT_NE(debuggee->registers(), nullptr);
}

TEST(Debuggee, launchAndResumeProgramExitingImmediately)
{
    auto debuggee = launch(programExitingImmediately());
    debuggee->resume();
    debuggee->updateProcessState(true);

    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Exited{0}});
    ASSERT_EQ(debuggee->registers(), nullptr);
    ASSERT_THROW(debuggee->resume(), Error);
}

TEST(Debuggee, exitStatusSurvivesLaterUpdates)
{
    auto debuggee = launch(programExitingImmediately());
    debuggee->resume();
    debuggee->updateProcessState(true);
    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Exited{0}});

    debuggee->updateProcessState(false);
    debuggee->updateProcessState(true);

    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Exited{0}});
}

TEST(Debuggee, interruptStopsBlockingWait)
{
    auto debuggee = launch(programRunningEndlessly());
    debuggee->resume();

    ReceiveInterrupts receiveInterrupts;

    /* SIGINT is directed at the whole process; blocking it here makes
       the waiting thread take it. */
    std::thread pressCtrlC([]() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        kill(getpid(), SIGINT);
    });

    debuggee->updateProcessState(true);
    pressCtrlC.join();

    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Stopped{SIGSTOP}});
    ASSERT_NE(debuggee->registers(), nullptr);
    ASSERT_FALSE(isInterrupted());
}

TEST(Debuggee, terminatedBySignal)
{
    auto debuggee = launch(programRunningEndlessly());
    auto pid = debuggee->pid();

    ASSERT_EQ(kill(pid, SIGKILL), 0);
    debuggee->updateProcessState(true);

    ASSERT_EQ(debuggee->processState(), ProcessState{ProcessState::Terminated{SIGKILL}});
    ASSERT_FALSE(debuggee->processState().isAlive());
}

TEST(Debuggee, writeRegisterIsCommitted)
{
    auto debuggee = launch(programRunningEndlessly());
    auto * regs = debuggee->registers();
    ASSERT_NE(regs, nullptr);

    regs->write(RegisterId::R13, uint64_t(0x1234));

    Byte128 bytes;
    bytes.fill(0x42);
    regs->write(RegisterId::Xmm3, bytes);

    regs->writeAny(RegisterId::Dr0, uint32_t(0));

    auto fresh = Registers::readWithPtrace(debuggee->pid());
    ASSERT_EQ(fresh.read(RegisterId::R13), RegisterValue{uint64_t(0x1234)});
    ASSERT_EQ(fresh.read(RegisterId::R13d), RegisterValue{uint32_t(0x1234)});
    ASSERT_EQ(fresh.read(RegisterId::Xmm3), RegisterValue{bytes});
}

TEST(Debuggee, writeSubRegisterKeepsTheRest)
{
    auto debuggee = launch(programRunningEndlessly());
    auto * regs = debuggee->registers();
    ASSERT_NE(regs, nullptr);

    regs->write(RegisterId::Rbx, uint64_t(0x1122334455667788));
    regs->write(RegisterId::Bh, uint8_t(0));

    auto fresh = Registers::readWithPtrace(debuggee->pid());
    ASSERT_EQ(fresh.read(RegisterId::Rbx), RegisterValue{uint64_t(0x1122334455660088)});
}

TEST(Debuggee, rejectedRegisterWriteLeavesSnapshotUnchanged)
{
    auto debuggee = launch(programRunningEndlessly());
    auto * regs = debuggee->registers();
    ASSERT_NE(regs, nullptr);

    auto before = regs->read(RegisterId::Cs);

    /* The kernel refuses code segment selectors user space may not
       load. */
    ASSERT_THROW(regs->write(RegisterId::Cs, uint64_t(0x1234)), SysError);

    ASSERT_EQ(regs->read(RegisterId::Cs), before);
    ASSERT_EQ(Registers::readWithPtrace(debuggee->pid()).read(RegisterId::Cs), before);
}

} // namespace sdbg
