#include <carlink/relay/wire.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace carlink::relay {

std::string WireMessage::toJson() const {
    nlohmann::json envelope = {
        {"event", event},
        {"data", data}
    };
    return envelope.dump();
}

core::Result<WireMessage> WireMessage::fromJson(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return {core::ErrorCode::InvalidMessage, "Message is not valid JSON"};
    }
    if (!parsed.is_object()) {
        return {core::ErrorCode::InvalidMessage, "Message must be a JSON object"};
    }

    auto event = parsed.find("event");
    if (event == parsed.end() || !event->is_string() || event->get<std::string>().empty()) {
        return {core::ErrorCode::MissingField, "Message has no event"};
    }

    WireMessage message;
    message.event = event->get<std::string>();

    auto data = parsed.find("data");
    if (data == parsed.end() || data->is_null()) {
        return message;
    }
    if (!data->is_object()) {
        return {core::ErrorCode::InvalidMessage, "Message data must be an object"};
    }
    message.data = *data;
    return message;
}

std::string toIsoTimestamp(std::chrono::system_clock::time_point time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

} // namespace carlink::relay
