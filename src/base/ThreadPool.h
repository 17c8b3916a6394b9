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

#ifndef BLOBXFER_BASE_THREADPOOL_H_
#define BLOBXFER_BASE_THREADPOOL_H_

#include <stddef.h>

#include <list>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace BX {

namespace Transfer {
class TransferManager;
}  // namespace Transfer

namespace Threading {

class TaskHandle;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// A fixed number of worker threads consuming a FIFO task queue. Workers are
// started by Initialize, queued tasks which have not been started are
// dropped when the pool is destructed.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize,
                      const std::string &name = std::string());
  ~ThreadPool();

 public:
  void SubmitToThread(const Task &task);

  size_t GetPoolSize() const { return m_poolSize; }
  const std::string &GetName() const { return m_name; }
  size_t GetQueuedTaskCount();

 private:
  Task *PopTask();

  // Block until a task is queued or the worker is stopped, the caller owns
  // the returned task. Return NULL for a stopped worker.
  Task *WaitForTask(const TaskHandle &worker);

  // Initialize create needed TaskHandlers (worker thread)
  // Normally, this should only get called once
  void Initialize();

  // Workers exit after their current task. After this has been called,
  // queued tasks will never been handled.
  void StopProcessing();

 private:
  size_t m_poolSize;
  std::string m_name;
  std::list<Task *> m_tasks;
  boost::mutex m_queueLock;
  std::vector<TaskHandle *> m_taskHandles;
  boost::mutex m_syncLock;
  boost::condition_variable m_syncConditionVar;

  friend class TaskHandle;
  friend class ThreadPoolTest;
  friend class BX::Transfer::TransferManager;
};

}  // namespace Threading
}  // namespace BX

#endif  // BLOBXFER_BASE_THREADPOOL_H_
