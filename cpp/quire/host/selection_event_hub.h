#ifndef QUIRE_HOST_SELECTION_EVENT_HUB_H
#define QUIRE_HOST_SELECTION_EVENT_HUB_H

#include "quire/toolbar/toolbar_coordinator.h"
#include <cstdint>
#include <functional>
#include <vector>

namespace quire {

struct SelectionChangeEvent {
    std::uint32_t surfaceId = 0;
    SelectionOwner owner = SelectionOwner::Editor;
};

/**
 * SelectionEventHub: fan-out of the host's document-wide selection-change
 * notification. Each editor instance subscribes on init and unsubscribes on
 * teardown, and filters events by surface id.
 */
class SelectionEventHub {
public:
    using Listener = std::function<void(const SelectionChangeEvent&)>;

    std::uint32_t subscribe(Listener listener);
    void unsubscribe(std::uint32_t token);
    void publish(const SelectionChangeEvent& event);
    std::size_t listenerCount() const { return listeners_.size(); }

private:
    struct Entry {
        std::uint32_t token;
        Listener listener;
    };

    std::vector<Entry> listeners_;
    std::uint32_t nextToken_ = 1;
};

} // namespace quire

#endif // QUIRE_HOST_SELECTION_EVENT_HUB_H
