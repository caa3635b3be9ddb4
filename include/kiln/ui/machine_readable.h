#pragma once

#include <kiln/core/types.h>
#include <kiln/ui/ui.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::ui {

enum class MessageKind { Say, Message, Error, Question };

constexpr const char* messageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Say: return "say";
        case MessageKind::Message: return "message";
        case MessageKind::Error: return "error";
        case MessageKind::Question: return "question";
    }
    return "message";
}

/**
 * One machine-readable record: `timestamp,target,type,data...`.
 *
 * Plain UI calls become events of type "ui" whose first data field is the
 * message kind, e.g. `1700000000,web,ui,say,Starting build`.
 */
struct UiEvent {
    int64_t timestamp{0}; ///< Unix seconds
    std::string target;   ///< Empty for host-level messages
    std::string type;
    std::vector<std::string> data;

    static UiEvent forMessage(std::string target, MessageKind kind, std::string text);

    bool operator==(const UiEvent&) const = default;
};

// Backslash-escapes comma, newline, carriage return and backslash.
std::string escapeField(std::string_view value);
std::string unescapeField(std::string_view value);

// Encodes an event as one line without the trailing newline.
std::string encodeEvent(const UiEvent& event);

// Inverse of encodeEvent(); fails on lines with fewer than three fields or a
// non-numeric timestamp.
Result<UiEvent> decodeEvent(std::string_view line);

/**
 * Line-oriented machine-readable UI for scripted consumers.
 *
 * All instances derived through withTarget() share one LineWriter, so events
 * from concurrent builds are never interleaved within a line.
 */
class MachineReadableUi : public IUi {
public:
    using Clock = std::function<int64_t()>;

    explicit MachineReadableUi(std::shared_ptr<LineWriter> writer, std::string target = {},
                               Clock clock = {});

    Result<std::string> ask(const std::string& query) override;
    void say(const std::string& message) override;
    void message(const std::string& message) override;
    void error(const std::string& message) override;
    void machine(const std::string& type, const std::vector<std::string>& data) override;

    std::shared_ptr<MachineReadableUi> withTarget(std::string target) const;
    const std::string& target() const noexcept { return target_; }

private:
    void emit(UiEvent event);

    std::shared_ptr<LineWriter> writer_;
    std::string target_;
    Clock clock_;
};

} // namespace kiln::ui
