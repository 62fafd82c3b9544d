/*
 *    Copyright (c) 2024, The OpenThread Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <errno.h>
#include <gtest/gtest.h>

#include "common/executor.hpp"
#include "common/task_runner.hpp"

namespace {

int RunOnce(nsd::TaskRunner &aTaskRunner, nsd::Seconds aTimeout)
{
    int                  rval;
    nsd::MainloopContext mainloop;

    mainloop.Reset(aTimeout);
    aTaskRunner.Update(mainloop);
    rval = select(mainloop.mMaxFd + 1, &mainloop.mReadFdSet, &mainloop.mWriteFdSet, &mainloop.mErrorFdSet,
                  &mainloop.mTimeout);
    if (rval >= 0)
    {
        aTaskRunner.Process(mainloop);
    }

    return rval;
}

} // namespace

TEST(TaskRunner, TestSingleThread)
{
    int             counter = 0;
    nsd::TaskRunner taskRunner;

    // Increase the `counter` to 3.
    taskRunner.Post([&]() {
        ++counter;
        taskRunner.Post([&]() {
            ++counter;
            taskRunner.Post([&]() { ++counter; });
        });
    });

    EXPECT_EQ(1, RunOnce(taskRunner, nsd::Seconds(10)));
    EXPECT_EQ(3, counter);
}

TEST(TaskRunner, TestTasksOrder)
{
    std::string     str;
    nsd::TaskRunner taskRunner;

    taskRunner.Post([&]() { str.push_back('a'); });
    taskRunner.Post([&]() { str.push_back('b'); });
    taskRunner.Post([&]() { str.push_back('c'); });

    EXPECT_EQ(1, RunOnce(taskRunner, nsd::Seconds(2)));

    // Make sure the tasks are executed in the order of posting.
    EXPECT_STREQ("abc", str.c_str());
}

TEST(TaskRunner, TestExecuteIsDeferred)
{
    std::string     str;
    nsd::TaskRunner taskRunner;
    nsd::Executor  &executor = taskRunner;

    executor.Execute([&]() { str.push_back('a'); });
    str.push_back('b');

    EXPECT_EQ(1, RunOnce(taskRunner, nsd::Seconds(2)));
    EXPECT_STREQ("ba", str.c_str());
}

TEST(TaskRunner, TestInlineExecutor)
{
    std::string         str;
    nsd::InlineExecutor executor;

    executor.Execute([&]() { str.push_back('a'); });
    str.push_back('b');

    EXPECT_STREQ("ab", str.c_str());
}

TEST(TaskRunner, TestMultipleThreads)
{
    std::atomic<int>         counter{0};
    nsd::TaskRunner          taskRunner;
    std::vector<std::thread> threads;

    // Increase the `counter` to 10 in separate threads.
    for (size_t i = 0; i < 10; ++i)
    {
        threads.emplace_back([&]() { taskRunner.Post([&]() { ++counter; }); });
    }

    while (counter.load() < 10)
    {
        EXPECT_EQ(1, RunOnce(taskRunner, nsd::Seconds(10)));
    }

    for (auto &th : threads)
    {
        th.join();
    }

    EXPECT_EQ(10, counter.load());
}

TEST(TaskRunner, TestDelayedTasksOrder)
{
    std::string     str;
    nsd::TaskRunner taskRunner;

    taskRunner.Post(nsd::Milliseconds(10), [&]() { str.push_back('a'); });
    taskRunner.Post(nsd::Milliseconds(9), [&]() { str.push_back('b'); });
    taskRunner.Post(nsd::Milliseconds(10), [&]() { str.push_back('c'); });

    while (str.size() < 3)
    {
        int rval = RunOnce(taskRunner, nsd::Seconds(2));

        EXPECT_TRUE(rval >= 0 || errno == EINTR);
    }

    // Make sure that tasks with smaller delay are executed earlier.
    EXPECT_STREQ("bac", str.c_str());
}

TEST(TaskRunner, TestCancelDelayedTasks)
{
    std::string             str;
    nsd::TaskRunner         taskRunner;
    nsd::TaskRunner::TaskId tid1, tid2, tid3, tid4;

    tid1 = taskRunner.Post(nsd::Milliseconds(10), [&]() { str.push_back('a'); });
    tid2 = taskRunner.Post(nsd::Milliseconds(20), [&]() { str.push_back('b'); });
    tid3 = taskRunner.Post(nsd::Milliseconds(30), [&]() { str.push_back('c'); });
    tid4 = taskRunner.Post(nsd::Milliseconds(40), [&]() { str.push_back('d'); });

    EXPECT_TRUE(0 < tid1);
    EXPECT_TRUE(tid1 < tid2);
    EXPECT_TRUE(tid2 < tid3);
    EXPECT_TRUE(tid3 < tid4);

    taskRunner.Cancel(tid2);
    taskRunner.Post(nsd::Milliseconds(10), [&]() { taskRunner.Cancel(tid3); });

    while (str.size() < 2)
    {
        int rval = RunOnce(taskRunner, nsd::Seconds(2));

        EXPECT_TRUE(rval >= 0 || errno == EINTR);
    }

    // Make sure the cancelled tasks were not executed.
    EXPECT_STREQ("ad", str.c_str());

    // Make sure it's fine to cancel expired task IDs.
    taskRunner.Cancel(tid1);
    taskRunner.Cancel(tid2);
}

TEST(TaskRunner, TestDeadlineArmsAndCancelsFollowUp)
{
    std::string             str;
    nsd::TaskRunner         taskRunner;
    nsd::TaskRunner::TaskId grace = 0;
    nsd::TaskRunner::TaskId unused;

    // A deadline in seconds is cancelled long before it expires.
    unused = taskRunner.Post(nsd::Seconds(1), [&]() { str.push_back('x'); });
    taskRunner.Cancel(unused);

    taskRunner.Post(nsd::Milliseconds(10), [&]() {
        str.push_back('a');
        grace = taskRunner.Post(nsd::Milliseconds(30), [&]() { str.push_back('g'); });
        taskRunner.Post([&]() {
            str.push_back('b');
            taskRunner.Cancel(grace);
        });
    });
    taskRunner.Post(nsd::Milliseconds(60), [&]() { str.push_back('c'); });

    while (str.size() < 3)
    {
        int rval = RunOnce(taskRunner, nsd::Seconds(2));

        EXPECT_TRUE(rval >= 0 || errno == EINTR);
    }

    EXPECT_STREQ("abc", str.c_str());
    EXPECT_NE(0u, grace);
}
