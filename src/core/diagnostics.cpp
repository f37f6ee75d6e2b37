#include <relay/core/diagnostics.h>

#include <iostream>
#include <mutex>
#include <sstream>

namespace relay::core {

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
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        static std::mutex sink_mutex;
        const std::string line = format_diagnostic(event);
        std::lock_guard<std::mutex> lock(sink_mutex);
        std::cerr << line << '\n';
    };
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t retention) : retention_(retention) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id_;

    for (const auto& observer : observers_) {
        observer(event);
    }

    if (retention_ == 0) {
        return;
    }
    if (events_.size() >= retention_) {
        events_.pop_front();
    }
    events_.push_back(std::move(event));
}

void DiagnosticEmitter::debug(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Debug, module, stage, message);
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, module, stage, message);
}

void DiagnosticEmitter::warning(const std::string& module, const std::string& stage,
                                const std::string& message) {
    emit(Severity::Warning, module, stage, message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::deque<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace relay::core
