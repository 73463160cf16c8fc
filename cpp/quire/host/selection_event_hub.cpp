#include "quire/host/selection_event_hub.h"
#include <algorithm>

namespace quire {

std::uint32_t SelectionEventHub::subscribe(Listener listener) {
    const std::uint32_t token = nextToken_++;
    listeners_.push_back(Entry{token, std::move(listener)});
    return token;
}

void SelectionEventHub::unsubscribe(std::uint32_t token) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(), [token](const Entry& e) { return e.token == token; }),
        listeners_.end());
}

void SelectionEventHub::publish(const SelectionChangeEvent& event) {
    // Listeners may subscribe or unsubscribe while being notified.
    std::vector<std::uint32_t> tokens;
    tokens.reserve(listeners_.size());
    for (const Entry& entry : listeners_) tokens.push_back(entry.token);

    for (const std::uint32_t token : tokens) {
        auto it = std::find_if(listeners_.begin(), listeners_.end(), [token](const Entry& e) { return e.token == token; });
        if (it == listeners_.end() || !it->listener) continue;
        const Listener listener = it->listener;
        listener(event);
    }
}

} // namespace quire
