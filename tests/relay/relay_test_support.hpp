#pragma once

#include <carlink/relay/signaling_relay.hpp>

#include <map>
#include <string>
#include <vector>

namespace carlink::relay::test {

// Sink that keeps every delivery per connection, in order
class RecordingSink : public DeliverySink {
public:
    void deliver(const std::string& connection_id, const WireMessage& message) override {
        inbox[connection_id].push_back(message);
        ++total;
    }

    std::vector<WireMessage> take(const std::string& connection_id) {
        auto messages = std::move(inbox[connection_id]);
        inbox[connection_id].clear();
        return messages;
    }

    void clear() {
        inbox.clear();
        total = 0;
    }

    std::map<std::string, std::vector<WireMessage>> inbox;
    std::size_t total = 0;
};

} // namespace carlink::relay::test
