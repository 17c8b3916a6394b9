// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/ThreadPool.h"

namespace BX {

namespace Threading {

// In order to test ThreadPool private members, need to define
// test fixture and tests in the same namespace with ThreadPool,
// so they can be friends of class ThreadPool.

using boost::bind;
using boost::packaged_task;
using boost::shared_ptr;
using boost::type;
using boost::unique_future;
using ::testing::Test;

// Return n!. For negative, n! is defined to be 1;
int Factorial(int n) {
  int result = 1;
  for (int i = 1; i <= n; ++i) {
    result *= i;
  }
  return result;
}

void RunPackagedTask(shared_ptr<packaged_task<int> > task) { (*task)(); }

void AppendValue(std::vector<int> *values, boost::mutex *lock, int value) {
  boost::lock_guard<boost::mutex> locker(*lock);
  values->push_back(value);
}

static const int poolSize_ = 2;

class ThreadPoolTest : public Test {
 public:
  unique_future<int> SubmitFactorial(int n) {
    shared_ptr<packaged_task<int> > pTask =
        boost::make_shared<packaged_task<int> >(
            bind(type<int>(), Factorial, n));
    unique_future<int> f = pTask->get_future();
    m_pThreadPool->SubmitToThread(bind(RunPackagedTask, pTask));
    return f;
  }

 protected:
  void SetUp() {
    m_pThreadPool = new ThreadPool(poolSize_, "test");
    m_pThreadPool->Initialize();
  }

  void TearDown() { delete m_pThreadPool; }

  // test private member
  void TestInterruptThreadPool() {
    EXPECT_EQ(0u, m_pThreadPool->GetQueuedTaskCount());

    m_pThreadPool->StopProcessing();
    // give workers a chance to leave their wait loop
    boost::this_thread::sleep(boost::posix_time::milliseconds(50));
    unique_future<int> f = SubmitFactorial(5);
    EXPECT_EQ(1u, m_pThreadPool->GetQueuedTaskCount());

    f.timed_wait(boost::posix_time::milliseconds(100));
    boost::future_state::state fStatus = f.get_state();
    ASSERT_EQ(fStatus, boost::future_state::waiting);

    Task *task = m_pThreadPool->PopTask();
    ASSERT_TRUE(task != NULL);
    EXPECT_EQ(0u, m_pThreadPool->GetQueuedTaskCount());
    delete task;
  }

  // a single worker runs tasks in submission order
  void TestFifoOrder() {
    std::vector<int> values;
    boost::mutex lock;
    {
      ThreadPool pool(1, "fifo");
      for (int i = 0; i < 20; ++i) {
        pool.SubmitToThread(bind(AppendValue, &values, &lock, i));
      }
      pool.Initialize();
      shared_ptr<packaged_task<int> > last =
          boost::make_shared<packaged_task<int> >(
              bind(type<int>(), Factorial, 1));
      unique_future<int> f = last->get_future();
      pool.SubmitToThread(bind(RunPackagedTask, last));
      f.timed_wait(boost::posix_time::milliseconds(1000));
      ASSERT_TRUE(f.is_ready());
    }
    ASSERT_EQ(20u, values.size());
    for (int i = 0; i < 20; ++i) {
      EXPECT_EQ(i, values[i]);
    }
  }

 protected:
  ThreadPool *m_pThreadPool;
};

TEST_F(ThreadPoolTest, TestInterrupt) { TestInterruptThreadPool(); }

TEST_F(ThreadPoolTest, TestFifoOrder) { TestFifoOrder(); }

TEST_F(ThreadPoolTest, TestSubmitToThread) {
  int num = 5;
  unique_future<int> f = SubmitFactorial(num);
  f.timed_wait(boost::posix_time::milliseconds(100));
  boost::future_state::state fStatus = f.get_state();
  ASSERT_EQ(fStatus, boost::future_state::ready);
  ASSERT_TRUE(f.is_ready());
  EXPECT_EQ(f.get(), 120);

  unique_future<int> f1 = SubmitFactorial(num + 1);
  f1.timed_wait(boost::posix_time::milliseconds(100));
  boost::future_state::state fStatus1 = f1.get_state();
  ASSERT_EQ(fStatus1, boost::future_state::ready);
  ASSERT_TRUE(f1.is_ready());
  EXPECT_EQ(f1.get(), 720);
}

int result = 0;
boost::mutex lockResult;

void Accumulate(int value) {
  boost::lock_guard<boost::mutex> locker(lockResult);
  result += value;
}

void ThrowRuntimeError() { throw std::runtime_error("task failure"); }

TEST_F(ThreadPoolTest, TestManyTasks) {
  for (int i = 1; i <= 100; ++i) {
    m_pThreadPool->SubmitToThread(bind(Accumulate, i));
  }
  unique_future<int> last = SubmitFactorial(3);
  last.timed_wait(boost::posix_time::milliseconds(1000));
  ASSERT_TRUE(last.is_ready());
  boost::this_thread::sleep(boost::posix_time::milliseconds(50));
  boost::lock_guard<boost::mutex> locker(lockResult);
  EXPECT_EQ(result, 5050);
}

TEST_F(ThreadPoolTest, TestThrowingTaskKeepsWorker) {
  for (int i = 0; i < poolSize_ * 2; ++i) {
    m_pThreadPool->SubmitToThread(ThrowRuntimeError);
  }
  unique_future<int> f = SubmitFactorial(4);
  f.timed_wait(boost::posix_time::milliseconds(500));
  ASSERT_TRUE(f.is_ready());
  EXPECT_EQ(f.get(), 24);
}

TEST_F(ThreadPoolTest, TestAttributes) {
  EXPECT_EQ(static_cast<size_t>(poolSize_), m_pThreadPool->GetPoolSize());
  EXPECT_EQ(std::string("test"), m_pThreadPool->GetName());
}

}  // namespace Threading
}  // namespace BX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
