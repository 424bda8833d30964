#include "SSEBroadcaster.hpp"

void SSEBroadcaster::subscribe(SendEvent sendEvent) {
    std::lock_guard lock(mtx);
    clients.push_back(std::move(sendEvent));
}

void SSEBroadcaster::broadcast(const std::string& type, const std::string& data) {
    std::lock_guard lock(mtx);
    std::string event = "event: " + type + "\ndata: " + data + "\n\n";
    for (auto it = clients.begin(); it != clients.end();) {
        if ((*it)(event)) {
            ++it;
        } else {
            it = clients.erase(it);
        }
    }
}

size_t SSEBroadcaster::subscriberCount() const {
    std::lock_guard lock(mtx);
    return clients.size();
}
