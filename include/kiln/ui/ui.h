#pragma once

#include <kiln/core/types.h>

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::ui {

/**
 * Progress and output reporting sink.
 *
 * Every component (in-process or plugin) reports through this interface; for
 * plugins the calls are relayed over the RPC bridge to the host's instance.
 */
class IUi {
public:
    virtual ~IUi() = default;

    virtual Result<std::string> ask(const std::string& query) = 0;
    virtual void say(const std::string& message) = 0;
    virtual void message(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;

    /**
     * Machine-readable event. Ignored by human-oriented sinks.
     */
    virtual void machine(const std::string& type, const std::vector<std::string>& data) = 0;
};

/**
 * Serializes whole lines onto a shared stream.
 */
class LineWriter {
public:
    explicit LineWriter(std::ostream& out) : out_(out) {}

    void writeLine(std::string_view line);

private:
    std::mutex mutex_;
    std::ostream& out_;
};

/**
 * Human-oriented UI writing free text to an output and an error stream.
 */
class BasicUi : public IUi {
public:
    BasicUi(std::istream& in, std::ostream& out, std::ostream& err);

    Result<std::string> ask(const std::string& query) override;
    void say(const std::string& message) override;
    void message(const std::string& message) override;
    void error(const std::string& message) override;
    void machine(const std::string& type, const std::vector<std::string>& data) override;

private:
    std::mutex mutex_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

/**
 * Prefixes every message with the name of the build producing it.
 */
class TargetedUi : public IUi {
public:
    TargetedUi(std::shared_ptr<IUi> inner, std::string target);

    Result<std::string> ask(const std::string& query) override;
    void say(const std::string& message) override;
    void message(const std::string& message) override;
    void error(const std::string& message) override;
    void machine(const std::string& type, const std::vector<std::string>& data) override;

    const std::string& target() const noexcept { return target_; }

private:
    std::string prefixLines(std::string_view prefix, const std::string& message) const;

    std::shared_ptr<IUi> inner_;
    std::string target_;
};

/**
 * UI scoped to one build: machine-readable sinks stamp the target on every
 * record, anything else is wrapped in a TargetedUi.
 */
std::shared_ptr<IUi> forTarget(const std::shared_ptr<IUi>& ui, const std::string& target);

} // namespace kiln::ui
