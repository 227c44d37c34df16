#include "PaneRegistry.hpp"

#include "JsonLib.hpp"

namespace lpane {
namespace {
json paneToJson(PaneSession* pane) {
  json p;
  p["id"] = pane->paneId();
  p["domain"] = pane->domainId();
  p["title"] = pane->title();
  auto cwd = pane->currentWorkingDirectory();
  if (cwd) {
    p["cwd"] = *cwd;
  } else {
    p["cwd"] = nullptr;
  }
  p["dead"] = pane->isTerminated();
  return p;
}
}  // namespace

void PaneRegistry::addPane(shared_ptr<PaneSession> pane) {
  if (!pane) {
    throw std::invalid_argument("Cannot register a null pane");
  }
  lock_guard<std::mutex> guard(mutex);
  if (!panes.insert(make_pair(pane->paneId(), pane)).second) {
    throw std::runtime_error("Pane " + to_string(pane->paneId()) +
                             " is already registered");
  }
  VLOG(1) << "Registered pane " << pane->paneId();
}

shared_ptr<PaneSession> PaneRegistry::getPane(PaneId id) const {
  lock_guard<std::mutex> guard(mutex);
  auto it = panes.find(id);
  if (it == panes.end()) {
    return shared_ptr<PaneSession>();
  }
  return it->second;
}

shared_ptr<PaneSession> PaneRegistry::removePane(PaneId id) {
  lock_guard<std::mutex> guard(mutex);
  auto it = panes.find(id);
  if (it == panes.end()) {
    VLOG(1) << "Tried to remove a pane that doesn't exist: " << id;
    return shared_ptr<PaneSession>();
  }
  auto pane = it->second;
  panes.erase(it);
  return pane;
}

vector<PaneId> PaneRegistry::panesInDomain(DomainId domain) const {
  lock_guard<std::mutex> guard(mutex);
  vector<PaneId> retval;
  for (auto& it : panes) {
    if (it.second->domainId() == domain) {
      retval.push_back(it.first);
    }
  }
  return retval;
}

vector<PaneId> PaneRegistry::pruneDeadPanes() {
  vector<shared_ptr<PaneSession>> dropped;
  vector<PaneId> retval;
  {
    lock_guard<std::mutex> guard(mutex);
    for (auto it = panes.begin(); it != panes.end();) {
      if (it->second->isTerminated()) {
        retval.push_back(it->first);
        dropped.push_back(it->second);
        it = panes.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Panes are destroyed (and their children reaped) outside the lock
  dropped.clear();
  return retval;
}

string PaneRegistry::toJsonString() const {
  json state;
  state["panes"] = json::object();
  lock_guard<std::mutex> guard(mutex);
  for (auto& it : panes) {
    state["panes"][to_string(it.first)] = paneToJson(it.second.get());
  }
  return state.dump(2);
}
}  // namespace lpane
