#include <wrapflow/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>

namespace wrapflow::core {

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
    if (event.pass_id != 0) {
        oss << " (pass:" << event.pass_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stream_observer(std::ostream& out) {
    return [&out](const DiagnosticEvent& event) {
        out << format_diagnostic(event) << '\n';
    };
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (!enabled(severity)) return;

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.pass_id = pass_id_;

    for (const auto& observer : observers_) {
        observer(event);
    }

    if (events_.size() == capacity_) {
        events_.pop_front();
        ++dropped_;
    }
    events_.push_back(std::move(event));
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    return {events_.begin(), events_.end()};
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [severity](const DiagnosticEvent& e) { return e.severity == severity; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [&stage](const DiagnosticEvent& e) { return e.stage == stage; });
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
    dropped_ = 0;
}

} // namespace wrapflow::core
