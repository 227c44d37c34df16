#include "ProcessLifecycle.hpp"

namespace lpane {
namespace {
string describe(const optional<pid_t>& pid) {
  return pid ? "child " + to_string(*pid) : string("child");
}
}  // namespace

ProcessLifecycle::ProcessLifecycle(unique_ptr<ChildProcess> _process)
    : process(std::move(_process)), dead(false) {
  if (!process) {
    throw std::invalid_argument("ProcessLifecycle needs a child process");
  }
}

ProcessLifecycle::~ProcessLifecycle() {
  string name = describe(process->processId());
  try {
    ExitStatus reaped = process->killAndWait();
    VLOG(1) << "Reaped " << name << " with " << reaped;
    return;
  } catch (const std::exception& ex) {
    VLOG(1) << "Ignoring failure to kill " << name << ": " << ex.what();
  }
  try {
    ExitStatus reaped = process->wait();
    VLOG(1) << "Reaped " << name << " with " << reaped;
  } catch (const std::exception& ex) {
    VLOG(1) << "Ignoring failure to wait for " << name << ": " << ex.what();
  }
}

void ProcessLifecycle::terminate() {
  try {
    process->kill();
  } catch (const std::exception& ex) {
    VLOG(1) << "Ignoring failure to kill " << describe(process->processId())
            << ": " << ex.what();
  }
}

bool ProcessLifecycle::isTerminated() {
  if (dead) {
    return true;
  }
  try {
    status = process->tryWait();
    if (!status) {
      return false;
    }
    LOG(ERROR) << describe(process->processId()) << " has exited with "
               << *status;
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Cannot poll " << describe(process->processId())
               << ", treating it as dead: " << ex.what();
  }
  dead = true;
  return true;
}

ExitState ProcessLifecycle::exitState() {
  if (!isTerminated()) {
    return ExitState::Running;
  }
  return status ? ExitState::Exited : ExitState::Unknown;
}
}  // namespace lpane
