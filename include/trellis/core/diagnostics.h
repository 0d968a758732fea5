#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace trellis::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    // Operation or field that produced the event, e.g. "register" or
    // "set_child_width_max".
    std::string stage;
    // Node the event is about ("4v1"); empty for cache-wide events.
    std::string subject;
    std::string message;
    // Layout pass the event belongs to; 0 when no pass is active.
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

// "[warning] layout_cache/register 4v1 (cid:3): re-registered, fields reset"
std::string format_diagnostic(const DiagnosticEvent& event);

// Records cache events for the caller that owns the layout pass. Events
// below min_severity are never built or stored.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& subject, const std::string& message);

    // Lets callers skip formatting a message that would be dropped.
    bool accepts(Severity severity) const { return severity >= min_severity_; }

    void set_correlation_id(std::uint64_t id) { correlation_id_ = id; }
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    std::vector<DiagnosticEvent> events_for_subject(const std::string& subject) const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::uint64_t correlation_id_ = 0;
    // Debug events (per-node registration) are off unless asked for.
    Severity min_severity_ = Severity::Info;
};

} // namespace trellis::core
