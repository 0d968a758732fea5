#include <trellis/core/diagnostics.h>

#include <sstream>

namespace trellis::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
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
    if (!event.subject.empty()) {
        oss << " " << event.subject;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& subject,
                             const std::string& message) {
    if (!accepts(severity)) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.subject = subject;
    event.message = message;
    event.correlation_id = correlation_id_;
    events_.push_back(std::move(event));
}

namespace {

template <typename Pred>
std::vector<DiagnosticEvent> select(const std::vector<DiagnosticEvent>& events, Pred pred) {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events) {
        if (pred(e)) {
            result.push_back(e);
        }
    }
    return result;
}

} // namespace

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select(events_, [&](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    return select(events_, [&](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_subject(const std::string& subject) const {
    return select(events_, [&](const DiagnosticEvent& e) { return e.subject == subject; });
}

} // namespace trellis::core
