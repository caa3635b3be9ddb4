#pragma once

#include <kiln/ui/ui.h>

#include <mutex>
#include <string>
#include <vector>

namespace kiln::test_support {

// Captures every UI call as "kind: text" for assertions.
class RecordingUi : public ui::IUi {
public:
    Result<std::string> ask(const std::string& query) override {
        record("ask", query);
        return answer;
    }
    void say(const std::string& message) override { record("say", message); }
    void message(const std::string& message) override { record("message", message); }
    void error(const std::string& message) override { record("error", message); }
    void machine(const std::string& type, const std::vector<std::string>& data) override {
        std::string joined = type;
        for (const auto& d : data) {
            joined += "," + d;
        }
        record("machine", joined);
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : lines_) {
            if (l.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::string answer{"yes"};

private:
    void record(const char* kind, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::string(kind) + ": " + text);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

} // namespace kiln::test_support
