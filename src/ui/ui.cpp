#include <kiln/ui/machine_readable.h>
#include <kiln/ui/ui.h>

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <sstream>

namespace kiln::ui {

void LineWriter::writeLine(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

// ============================================================================
// BasicUi
// ============================================================================

BasicUi::BasicUi(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

Result<std::string> BasicUi::ask(const std::string& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("ui: ask: {}", query);
    out_ << query << ' ';
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        return Error{ErrorCode::IOError, "no input available to answer: " + query};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void BasicUi::say(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("ui: {}", message);
    out_ << message << '\n';
    out_.flush();
}

void BasicUi::message(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("ui: {}", message);
    out_ << message << '\n';
    out_.flush();
}

void BasicUi::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("ui error: {}", message);
    err_ << message << '\n';
    err_.flush();
}

void BasicUi::machine(const std::string& type, const std::vector<std::string>& data) {
    // Human output has no place for machine records; keep them in the log only.
    std::string joined;
    for (const auto& d : data) {
        joined += ' ';
        joined += d;
    }
    spdlog::info("machine readable: {}{}", type, joined);
}

// ============================================================================
// TargetedUi
// ============================================================================

TargetedUi::TargetedUi(std::shared_ptr<IUi> inner, std::string target)
    : inner_(std::move(inner)), target_(std::move(target)) {}

Result<std::string> TargetedUi::ask(const std::string& query) {
    return inner_->ask(prefixLines("==>", query));
}

void TargetedUi::say(const std::string& message) {
    inner_->say(prefixLines("==>", message));
}

void TargetedUi::message(const std::string& message) {
    inner_->message(prefixLines("   ", message));
}

void TargetedUi::error(const std::string& message) {
    inner_->error(prefixLines("==>", message));
}

void TargetedUi::machine(const std::string& type, const std::vector<std::string>& data) {
    inner_->machine(type, data);
}

std::string TargetedUi::prefixLines(std::string_view prefix, const std::string& message) const {
    std::ostringstream out;
    std::istringstream lines(message);
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!first) {
            out << '\n';
        }
        first = false;
        out << prefix << ' ' << target_ << ": " << line;
    }
    if (first) {
        out << prefix << ' ' << target_ << ": ";
    }
    return out.str();
}

std::shared_ptr<IUi> forTarget(const std::shared_ptr<IUi>& ui, const std::string& target) {
    if (auto machine = std::dynamic_pointer_cast<MachineReadableUi>(ui)) {
        return machine->withTarget(target);
    }
    return std::make_shared<TargetedUi>(ui, target);
}

} // namespace kiln::ui
