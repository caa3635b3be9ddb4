#include <kiln/ui/machine_readable.h>

#include <spdlog/spdlog.h>

#include <charconv>

namespace kiln::ui {

namespace {

int64_t unixNow() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// Splits on commas that are not preceded by an escaping backslash. Fields are
// returned still escaped.
std::vector<std::string_view> splitEscaped(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
        } else if (c == ',') {
            fields.push_back(line.substr(start, i - start));
            start = i + 1;
        }
    }
    fields.push_back(line.substr(start));
    return fields;
}

} // namespace

UiEvent UiEvent::forMessage(std::string target, MessageKind kind, std::string text) {
    UiEvent event;
    event.target = std::move(target);
    event.type = "ui";
    event.data = {messageKindName(kind), std::move(text)};
    return event;
}

std::string escapeField(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ',': out += "\\,"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string unescapeField(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != '\\' || i + 1 == value.size()) {
            out.push_back(c);
            continue;
        }
        char next = value[++i];
        switch (next) {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            default: out.push_back(next); break;
        }
    }
    return out;
}

std::string encodeEvent(const UiEvent& event) {
    std::string line = std::to_string(event.timestamp);
    line += ',';
    line += escapeField(event.target);
    line += ',';
    line += escapeField(event.type);
    for (const auto& d : event.data) {
        line += ',';
        line += escapeField(d);
    }
    return line;
}

Result<UiEvent> decodeEvent(std::string_view line) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }
    auto fields = splitEscaped(line);
    if (fields.size() < 3) {
        return Error{ErrorCode::InvalidArgument,
                     "machine-readable record needs at least 3 fields, got " +
                         std::to_string(fields.size())};
    }

    UiEvent event;
    auto ts = fields[0];
    auto [ptr, ec] = std::from_chars(ts.data(), ts.data() + ts.size(), event.timestamp);
    if (ec != std::errc{} || ptr != ts.data() + ts.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid timestamp in machine-readable record: " + std::string(ts)};
    }
    event.target = unescapeField(fields[1]);
    event.type = unescapeField(fields[2]);
    for (size_t i = 3; i < fields.size(); ++i) {
        event.data.push_back(unescapeField(fields[i]));
    }
    return event;
}

// ============================================================================
// MachineReadableUi
// ============================================================================

MachineReadableUi::MachineReadableUi(std::shared_ptr<LineWriter> writer, std::string target,
                                     Clock clock)
    : writer_(std::move(writer)), target_(std::move(target)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = unixNow;
    }
}

Result<std::string> MachineReadableUi::ask(const std::string& query) {
    emit(UiEvent::forMessage(target_, MessageKind::Question, query));
    return Error{ErrorCode::NotSupported, "machine-readable UI cannot ask questions: " + query};
}

void MachineReadableUi::say(const std::string& message) {
    emit(UiEvent::forMessage(target_, MessageKind::Say, message));
}

void MachineReadableUi::message(const std::string& message) {
    emit(UiEvent::forMessage(target_, MessageKind::Message, message));
}

void MachineReadableUi::error(const std::string& message) {
    emit(UiEvent::forMessage(target_, MessageKind::Error, message));
}

void MachineReadableUi::machine(const std::string& type, const std::vector<std::string>& data) {
    UiEvent event;
    event.target = target_;
    event.type = type;
    event.data = data;
    emit(std::move(event));
}

std::shared_ptr<MachineReadableUi> MachineReadableUi::withTarget(std::string target) const {
    return std::make_shared<MachineReadableUi>(writer_, std::move(target), clock_);
}

void MachineReadableUi::emit(UiEvent event) {
    event.timestamp = clock_();
    auto line = encodeEvent(event);
    spdlog::trace("machine readable: {}", line);
    writer_->writeLine(line);
}

} // namespace kiln::ui
