#include <stylebind/core/diagnostics.h>

#include <sstream>

namespace stylebind::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::optional<Severity> parse_severity(std::string_view name) {
    if (name == "debug") return Severity::Debug;
    if (name == "info") return Severity::Info;
    if (name == "warning" || name == "warn") return Severity::Warning;
    if (name == "error") return Severity::Error;
    return std::nullopt;
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard lock(mutex_);
        if (severity < min_severity_) {
            return;
        }
        event.timestamp = std::chrono::steady_clock::now();
        event.severity = severity;
        event.module = module;
        event.stage = stage;
        event.message = message;
        observers = observers_;
        if (retain_events_) {
            events_.push_back(event);
        }
    }

    // Observers may call back into the emitter from the same thread.
    std::lock_guard dispatch(dispatch_mutex_);
    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard lock(mutex_);
    return min_severity_;
}

bool DiagnosticEmitter::enabled(Severity severity) const {
    std::lock_guard lock(mutex_);
    return severity >= min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

void DiagnosticEmitter::set_retain_events(bool retain) {
    std::lock_guard lock(mutex_);
    retain_events_ = retain;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "Failed to process " << file << "\n";
    oss << "  error: " << error_kind << ": " << error_message << "\n";
    if (!causal_chain.empty()) {
        oss << "  while loading:\n";
        for (const auto& link : causal_chain) {
            oss << "    " << link << "\n";
        }
    }
    return oss.str();
}

} // namespace stylebind::core
