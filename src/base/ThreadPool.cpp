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

#include "base/ThreadPool.h"

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/TaskHandle.h"

namespace BX {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using boost::unique_lock;
using std::string;

// --------------------------------------------------------------------------
ThreadPool::ThreadPool(size_t poolSize, const string &name)
    : m_poolSize(poolSize), m_name(name) {}

// --------------------------------------------------------------------------
ThreadPool::~ThreadPool() {
  StopProcessing();

  BOOST_FOREACH (TaskHandle *taskHandle, m_taskHandles) { delete taskHandle; }
  m_taskHandles.clear();

  size_t dropped = 0;
  while (!m_tasks.empty()) {
    Task *task = m_tasks.front();
    m_tasks.pop_front();
    if (task) {
      delete task;
      ++dropped;
    }
  }
  DebugInfoIf(dropped > 0, "Thread pool " + m_name + " dropped " +
                               to_string(dropped) + " queued tasks");
}

// --------------------------------------------------------------------------
void ThreadPool::SubmitToThread(const Task &task) {
  {
    lock_guard<mutex> lock(m_queueLock);
    m_tasks.push_back(new Task(task));
  }
  lock_guard<mutex> lock(m_syncLock);
  m_syncConditionVar.notify_one();
}

// --------------------------------------------------------------------------
size_t ThreadPool::GetQueuedTaskCount() {
  lock_guard<mutex> lock(m_queueLock);
  return m_tasks.size();
}

// --------------------------------------------------------------------------
Task *ThreadPool::PopTask() {
  lock_guard<mutex> lock(m_queueLock);
  if (!m_tasks.empty()) {
    Task *task = m_tasks.front();
    if (task) {
      m_tasks.pop_front();
      return task;
    }
  }
  return NULL;
}

// --------------------------------------------------------------------------
Task *ThreadPool::WaitForTask(const TaskHandle &worker) {
  unique_lock<mutex> lock(m_syncLock);
  while (worker.ShouldContinue()) {
    Task *task = PopTask();
    if (task) {
      return task;
    }
    m_syncConditionVar.wait(lock);
  }
  return NULL;
}

// --------------------------------------------------------------------------
void ThreadPool::Initialize() {
  if (!m_taskHandles.empty()) {
    DebugWarning("Thread pool " + m_name + " is already initialized");
    return;
  }
  for (size_t i = 0; i < m_poolSize; ++i) {
    m_taskHandles.push_back(new TaskHandle(*this, i));
  }
  DebugInfo("Thread pool " + m_name + " started with " +
            to_string(m_poolSize) + " workers");
}

// --------------------------------------------------------------------------
void ThreadPool::StopProcessing() {
  BOOST_FOREACH(TaskHandle *taskHandle, m_taskHandles) { taskHandle->Stop(); }
  lock_guard<mutex> lock(m_syncLock);
  m_syncConditionVar.notify_all();
}

}  // namespace Threading
}  // namespace BX
