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

#include "base/TaskHandle.h"

#include <exception>
#include <string>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/shared_mutex.hpp"

#include "base/LogMacros.h"
#include "base/ThreadPool.h"

namespace BX {

namespace Threading {

using boost::lock_guard;
using boost::scoped_ptr;
using boost::shared_lock;
using boost::shared_mutex;
using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
TaskHandle::TaskHandle(ThreadPool &threadPool, size_t index)
    : m_continue(true),
      m_threadPool(threadPool),
      m_index(index),
      m_thread(boost::bind(&TaskHandle::operator(), this)) {}

// --------------------------------------------------------------------------
TaskHandle::~TaskHandle() {
  Stop();
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

// --------------------------------------------------------------------------
void TaskHandle::Stop() {
  lock_guard<shared_mutex> lock(m_continueLock);
  m_continue = false;
}

// --------------------------------------------------------------------------
bool TaskHandle::ShouldContinue() const {
  shared_lock<shared_mutex> lock(m_continueLock);
  return m_continue;
}

// --------------------------------------------------------------------------
void TaskHandle::operator()() {
  for (;;) {
    // NULL once this worker has been stopped
    scoped_ptr<Task> task(m_threadPool.WaitForTask(*this));
    if (!task) {
      break;
    }
    Run(*task);
  }
  DebugInfo("Worker " + to_string(m_index) + " of thread pool " +
            m_threadPool.GetName() + " exits");
}

// --------------------------------------------------------------------------
void TaskHandle::Run(const Task &task) {
  try {
    task();
  } catch (const std::exception &err) {
    Error("Worker " + to_string(m_index) + " of thread pool " +
          m_threadPool.GetName() + " caught exception from task: " +
          string(err.what()));
  }
}

}  // namespace Threading
}  // namespace BX
