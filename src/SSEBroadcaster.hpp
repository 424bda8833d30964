#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Fans server-sent events out to every subscribed stream.
class SSEBroadcaster {
public:
    // Returns false once the stream is gone; the subscriber is then dropped.
    using SendEvent = std::function<bool(const std::string&)>;

    void subscribe(SendEvent sendEvent);
    void broadcast(const std::string& type, const std::string& data);
    size_t subscriberCount() const;

private:
    std::vector<SendEvent> clients;
    mutable std::mutex mtx;
};
