#ifndef __LPANE_PANE_REGISTRY__
#define __LPANE_PANE_REGISTRY__

#include "Headers.hpp"
#include "PaneSession.hpp"

namespace lpane {
/**
 * @brief The multiplexer's table of live panes, keyed by PaneId.
 */
class PaneRegistry {
 public:
  PaneRegistry() {}

  /** @throws std::runtime_error if a pane with the same id is registered. */
  void addPane(shared_ptr<PaneSession> pane);
  /** @brief The pane with this id, or nullptr. */
  shared_ptr<PaneSession> getPane(PaneId id) const;
  /** @brief Unregisters a pane and returns it, nullptr if it was unknown. */
  shared_ptr<PaneSession> removePane(PaneId id);
  /** @brief Ids of every pane belonging to `domain`, ascending. */
  vector<PaneId> panesInDomain(DomainId domain) const;
  /** @brief Drops panes whose child has exited and returns their ids. */
  vector<PaneId> pruneDeadPanes();

  /** @brief Serializes every pane's id, domain, title, cwd and liveness. */
  string toJsonString() const;

  inline int numPanes() const {
    lock_guard<std::mutex> guard(mutex);
    return int(panes.size());
  }

 protected:
  mutable std::mutex mutex;
  map<PaneId, shared_ptr<PaneSession>> panes;
};
}  // namespace lpane

#endif  // __LPANE_PANE_REGISTRY__
