#pragma once

#include <relay/core/config.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace relay::core {

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
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Writes each event as one formatted line to std::cerr. Lines from
// concurrent connections are serialized by a process-wide mutex.
DiagnosticObserver stderr_observer();

// Per-connection event log. Not thread-safe: each connection thread owns
// its emitter. Only the most recent `retention` events are kept so a long
// relay does not grow the log without bound.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t retention = config::kDiagnosticRetention);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void debug(const std::string& module, const std::string& stage, const std::string& message);
    void info(const std::string& module, const std::string& stage, const std::string& message);
    void warning(const std::string& module, const std::string& stage, const std::string& message);
    void error(const std::string& module, const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::deque<DiagnosticEvent>& events() const;

    void clear();
    std::size_t size() const;

private:
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t retention_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace relay::core
