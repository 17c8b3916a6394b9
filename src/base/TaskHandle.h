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

#ifndef BLOBXFER_BASE_TASKHANDLE_H_
#define BLOBXFER_BASE_TASKHANDLE_H_

#include <stddef.h>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/thread/shared_mutex.hpp"
#include "boost/thread/thread.hpp"

namespace BX {

namespace Threading {

class ThreadPool;
typedef boost::function<void()> Task;

// One worker thread of a ThreadPool. The thread starts on construction and
// keeps taking tasks from the pool until it is stopped.
class TaskHandle : private boost::noncopyable {
 public:
  TaskHandle(ThreadPool &threadPool, size_t index);  // NOLINT
  ~TaskHandle();

 public:
  size_t GetIndex() const { return m_index; }
  bool ShouldContinue() const;

 private:
  void Stop();
  void operator()();
  void Run(const Task &task);

 private:
  bool m_continue;
  mutable boost::shared_mutex m_continueLock;
  ThreadPool &m_threadPool;
  size_t m_index;
  boost::thread m_thread;

  friend class ThreadPool;
};

}  // namespace Threading
}  // namespace BX

#endif  // BLOBXFER_BASE_TASKHANDLE_H_
