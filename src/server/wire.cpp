#include "wire.hpp"

#include <nlohmann/json.hpp>

namespace snapgate::wire {

namespace {

using json = nlohmann::ordered_json;

[[nodiscard]] auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] auto dump(const json& j) -> std::string {
    // Replace invalid UTF-8 rather than throwing; names come from the database.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

[[nodiscard]] auto string_field(const json& object, const char* key) -> Result<std::string> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::string{};
    }
    if (!it->is_string()) {
        return make_error<std::string>(ErrorCode::protocol_validation,
                                       std::string("Field '") + key + "' must be a string");
    }
    return std::string(trim(it->get_ref<const std::string&>()));
}

} // namespace

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_handshake(std::string_view raw) -> Result<Handshake> {
    const auto body = trim(raw);
    if (body.empty()) {
        return make_error<Handshake>(ErrorCode::protocol_validation, "No initial data received");
    }

    json message;
    try {
        message = json::parse(body);
    } catch (const json::exception& e) {
        return make_error<Handshake>(ErrorCode::protocol_validation,
                                     std::string("Invalid JSON format: ") + e.what());
    }

    if (!message.is_object()) {
        return make_error<Handshake>(ErrorCode::protocol_validation,
                                     "Handshake must be a JSON object");
    }

    Handshake handshake;
    handshake.room = SNAPGATE_TRY(string_field(message, "room"));
    handshake.uid = SNAPGATE_TRY(string_field(message, "uid"));

    if (handshake.room.empty() || handshake.uid.empty()) {
        return make_error<Handshake>(ErrorCode::protocol_validation,
                                     "Missing required fields: room and uid");
    }
    return handshake;
}

auto encode_error(std::string_view reason) -> std::string {
    return dump(json{{"status", STATUS_ERROR}, {"reason", reason}});
}

auto encode_denied(std::string_view reason) -> std::string {
    return dump(json{{"status", STATUS_DENIED}, {"reason", reason}});
}

auto encode_ready(std::string_view user) -> std::string {
    return dump(json{{"status", STATUS_OK}, {"message", IMAGE_PROMPT}, {"user", user}});
}

auto encode_granted(std::string_view timestamp, size_t size, std::string_view user)
    -> std::string {
    return dump(json{
        {"status", STATUS_GRANTED}, {"timestamp", timestamp}, {"size", size}, {"user", user}});
}

} // namespace snapgate::wire
