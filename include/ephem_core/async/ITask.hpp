#pragma once

#include <memory>
#include <string>

namespace ephem_core::async {

// A unit of work executed by a Worker. Tasks report their own results
// (usually through a promise); execute() should not let exceptions escape.
class ITask {
 public:
  virtual ~ITask() = default;

  virtual void execute() = 0;

  // Called instead of execute() when the pool shuts down with the task still queued
  virtual void abandon(const std::string& reason) = 0;

  virtual const char* get_type() const = 0;
};

using ITaskPtr = std::unique_ptr<ITask>;

}  // namespace ephem_core::async
