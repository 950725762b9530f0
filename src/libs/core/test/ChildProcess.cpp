/*
 * Copyright (C) 2025 The Audex authors
 *
 * This file is part of Audex.
 *
 * Audex is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Audex is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Audex.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "core/IChildProcess.hpp"
#include "core/IChildProcessManager.hpp"

namespace audex::core::tests
{
    namespace
    {
        void onInterrupt(int) {}

        // Puts the test process in its own process group with a SIGINT handler, so that kill(0, SIGINT) acts like a terminal Ctrl-C
        class ScopedInterruptibleGroup
        {
        public:
            ScopedInterruptibleGroup()
                : _previousGroup{ ::getpgrp() }
            {
                if (_previousGroup != ::getpid() && ::setpgid(0, 0) == -1)
                    return;

                struct sigaction action{};
                action.sa_handler = onInterrupt;
                ::sigemptyset(&action.sa_mask);
                _active = ::sigaction(SIGINT, &action, &_previousAction) == 0;
            }

            ~ScopedInterruptibleGroup()
            {
                if (_active)
                    ::sigaction(SIGINT, &_previousAction, nullptr);
                if (_previousGroup != ::getpgrp())
                    ::setpgid(0, _previousGroup);
            }

            ScopedInterruptibleGroup(const ScopedInterruptibleGroup&) = delete;
            ScopedInterruptibleGroup& operator=(const ScopedInterruptibleGroup&) = delete;

            bool isActive() const { return _active; }

        private:
            const ::pid_t _previousGroup;
            struct sigaction _previousAction{};
            bool _active{};
        };

        const IChildProcess::Output& runShell(IChildProcessManager& manager, std::unique_ptr<IChildProcess>& process, const std::string& script)
        {
            process = manager.spawnChildProcess("/bin/sh", IChildProcess::Args{ "/bin/sh", "-c", script });
            return process->wait();
        }
    } // namespace

    TEST(ChildProcess, captureOutputs)
    {
        auto manager{ createChildProcessManager() };
        std::unique_ptr<IChildProcess> process;

        const IChildProcess::Output& output{ runShell(*manager, process, "echo out; echo err >&2; exit 3") };
        ASSERT_TRUE(output.exitCode.has_value());
        EXPECT_EQ(*output.exitCode, 3);
        EXPECT_EQ(output.standardOutput, "out\n");
        EXPECT_EQ(output.standardError, "err\n");

        // waiting again gives the same result
        const IChildProcess::Output& secondOutput{ process->wait() };
        EXPECT_EQ(secondOutput.exitCode, 3);
        EXPECT_EQ(secondOutput.standardOutput, "out\n");
    }

    TEST(ChildProcess, success)
    {
        auto manager{ createChildProcessManager() };
        std::unique_ptr<IChildProcess> process;

        const IChildProcess::Output& output{ runShell(*manager, process, "true") };
        EXPECT_EQ(output.exitCode, 0);
        EXPECT_TRUE(output.standardOutput.empty());
        EXPECT_TRUE(output.standardError.empty());
    }

    TEST(ChildProcess, argumentsNotSplit)
    {
        auto manager{ createChildProcessManager() };

        auto process{ manager->spawnChildProcess("/bin/sh", IChildProcess::Args{ "/bin/sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "c;d", "" }) };
        const IChildProcess::Output& output{ process->wait() };
        EXPECT_EQ(output.exitCode, 0);
        EXPECT_EQ(output.standardOutput, "a b|c;d||");
    }

    TEST(ChildProcess, stdinIsClosed)
    {
        auto manager{ createChildProcessManager() };
        std::unique_ptr<IChildProcess> process;

        // would block forever if stdin was inherited from a terminal
        const IChildProcess::Output& output{ runShell(*manager, process, "cat; echo done") };
        EXPECT_EQ(output.exitCode, 0);
        EXPECT_EQ(output.standardOutput, "done\n");
    }

    TEST(ChildProcess, largeOutputs)
    {
        auto manager{ createChildProcessManager() };
        std::unique_ptr<IChildProcess> process;

        // more than a pipe buffer on both streams at the same time
        const IChildProcess::Output& output{ runShell(*manager, process, "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo 9876543210 >&2; i=$((i+1)); done") };
        EXPECT_EQ(output.exitCode, 0);
        EXPECT_EQ(output.standardOutput.size(), 20000 * 11);
        EXPECT_EQ(output.standardError.size(), 20000 * 11);
    }

    TEST(ChildProcess, missingExecutable)
    {
        auto manager{ createChildProcessManager() };

        auto process{ manager->spawnChildProcess("/nonexistent/audex-tool", IChildProcess::Args{ "audex-tool", "-version" }) };
        const IChildProcess::Output& output{ process->wait() };
        EXPECT_EQ(output.exitCode, 127);
        EXPECT_FALSE(output.standardError.empty());
    }

    TEST(ChildProcess, killedBySignal)
    {
        auto manager{ createChildProcessManager() };
        std::unique_ptr<IChildProcess> process;

        const IChildProcess::Output& output{ runShell(*manager, process, "kill -9 $$") };
        EXPECT_FALSE(output.exitCode.has_value());
    }

    TEST(ChildProcess, groupInterruptDoesNotReachChild)
    {
        const ScopedInterruptibleGroup group;
        if (!group.isActive())
            GTEST_SKIP() << "Cannot set up a dedicated process group";

        auto manager{ createChildProcessManager() };
        auto process{ manager->spawnChildProcess("/bin/sh", IChildProcess::Args{ "/bin/sh", "-c", "sleep 1; echo done" }) };

        std::thread interrupter{ [] {
            std::this_thread::sleep_for(std::chrono::milliseconds{ 300 });
            ::kill(0, SIGINT);
        } };

        const IChildProcess::Output& output{ process->wait() };
        interrupter.join();

        EXPECT_EQ(output.exitCode, 0);
        EXPECT_EQ(output.standardOutput, "done\n");
    }

    TEST(ChildProcess, destroyWithoutWait)
    {
        auto manager{ createChildProcessManager() };

        auto process{ manager->spawnChildProcess("/bin/sh", IChildProcess::Args{ "/bin/sh", "-c", "sleep 30" }) };
        process.reset();
    }
} // namespace audex::core::tests
