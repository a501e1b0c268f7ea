#include "loader/Scheduler.hpp"

#include "core/Log.hpp"

#include <algorithm>

namespace loader {

namespace {

class FunctionJob : public Job {
public:
  FunctionJob(std::string name, Scheduler::StepFn step)
      : name(std::move(name)), step(std::move(step)) {}

  bool Step() override { return step(); }
  const char *GetName() const override { return name.c_str(); }

private:
  std::string name;
  Scheduler::StepFn step;
};

} // namespace

void Scheduler::Start(std::unique_ptr<Job> job) {
  if (!job) {
    return;
  }
  LOG_TRACE("Scheduler: start '{}'", job->GetName());
  incoming.push_back(std::move(job));
}

void Scheduler::Start(std::string name, StepFn step) {
  Start(std::make_unique<FunctionJob>(std::move(name), std::move(step)));
}

void Scheduler::Tick() {
  for (auto &job : incoming) {
    jobs.push_back(std::move(job));
  }
  incoming.clear();

  // Index loop: Step() may call Start(), which only touches `incoming`.
  const size_t count = jobs.size();
  for (size_t i = 0; i < count; ++i) {
    if (jobs[i]->Step()) {
      LOG_TRACE("Scheduler: '{}' finished", jobs[i]->GetName());
      jobs[i].reset();
    }
  }
  jobs.erase(std::remove(jobs.begin(), jobs.end(), nullptr), jobs.end());
}

} // namespace loader
