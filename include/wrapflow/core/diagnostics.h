#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace wrapflow::core {

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
    std::string stage;
    std::string message;
    std::uint64_t pass_id = 0;  // layout pass that produced the event, 0 if none
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes one formatted line per event to `out`.
DiagnosticObserver stream_observer(std::ostream& out);

// Layout runs once per frame, so the emitter keeps only the most recent
// `capacity` events. Observers still see every accepted event.
class DiagnosticEmitter {
public:
    static constexpr std::size_t kDefaultCapacity = 256;

    explicit DiagnosticEmitter(std::size_t capacity = kDefaultCapacity);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_pass_id(std::uint64_t id) { pass_id_ = id; }
    std::uint64_t pass_id() const { return pass_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }
    bool enabled(Severity severity) const { return severity >= min_severity_; }

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;

    // Number of accepted events evicted because the buffer was full.
    std::size_t dropped() const { return dropped_; }
    std::size_t capacity() const { return capacity_; }

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
    std::uint64_t pass_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

} // namespace wrapflow::core
