#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace loader {

// A unit of cooperative work. Step() runs once per tick and returns true
// when the job has finished.
class Job {
public:
  virtual ~Job() = default;
  virtual bool Step() = 0;
  virtual const char *GetName() const = 0;
};

// Per-tick job loop. Jobs started while a tick is running are first stepped
// on the following tick.
class Scheduler {
public:
  using StepFn = std::function<bool()>;

  void Start(std::unique_ptr<Job> job);
  void Start(std::string name, StepFn step);

  void Tick();

  bool IsIdle() const { return jobs.empty() && incoming.empty(); }
  size_t GetJobCount() const { return jobs.size() + incoming.size(); }

private:
  std::vector<std::unique_ptr<Job>> jobs;
  std::vector<std::unique_ptr<Job>> incoming;
};

} // namespace loader
