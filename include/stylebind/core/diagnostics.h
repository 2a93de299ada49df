#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);
std::optional<Severity> parse_severity(std::string_view name);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects events from the loader, the runner and the collaborators. Safe to
// share between threads. Observers run one event at a time outside the state
// lock, so they may call back into the emitter.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_min_severity(Severity min);
    Severity min_severity() const;
    bool enabled(Severity severity) const;

    void add_observer(DiagnosticObserver observer);

    // Event retention is off by default; a long batch run only needs observers.
    void set_retain_events(bool retain);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::recursive_mutex dispatch_mutex_;
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
    bool retain_events_ = false;
};

// What the batch host prints when one top-level file fails.
struct FailureTrace {
    std::string file;
    std::string error_kind;
    std::string error_message;
    std::vector<std::string> causal_chain;  // innermost first

    std::string format() const;
};

} // namespace stylebind::core
