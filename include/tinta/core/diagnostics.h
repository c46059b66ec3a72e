#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tinta::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured events from the normalizer and the rasterizer.
// Safe to share between the worker threads of a single render call.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warn(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }
    void error(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Error, module, stage, message);
    }

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    bool has_message_containing(const std::string& needle) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

// Null-safe helpers for code paths where the caller did not supply an emitter.
inline void warn(DiagnosticEmitter* emitter, const std::string& module,
                 const std::string& stage, const std::string& message) {
    if (emitter) emitter->warn(module, stage, message);
}

inline void info(DiagnosticEmitter* emitter, const std::string& module,
                 const std::string& stage, const std::string& message) {
    if (emitter) emitter->info(module, stage, message);
}

}  // namespace tinta::core
