#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace neumorph::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// Where in the engine an event was raised. Each stage belongs to one
// module: style (resolve, parse) or shadow (outline, render).
enum class Stage {
    ResolveStyle,
    ParseStyle,
    ResolveOutline,
    Render,
};

const char* severity_name(Severity severity);
const char* stage_name(Stage stage);
const char* stage_module(Stage stage);

struct DiagnosticEvent {
    Severity severity = Severity::Info;
    Stage stage = Stage::Render;
    std::string message;
    // Id of the innermost draw open when the event was raised, 0 outside one
    std::uint64_t draw_id = 0;
};

// "[info] shadow/render (draw 3): degenerate bounds; shadows skipped"
std::string format_diagnostic(const DiagnosticEvent& event);

// Collects degraded-input reports from the engine. The engine never owns
// one; callers pass an emitter into the calls they want reports from.
class DiagnosticEmitter {
public:
    void emit(Severity severity, Stage stage, const std::string& message);

    // Draws nest (a content callback may render another node), so ids form
    // a stack. Ids start at 1 and are never reused until clear().
    std::uint64_t begin_draw();
    void end_draw();
    std::uint64_t current_draw() const;
    std::size_t draw_count() const { return next_draw_id_ - 1; }

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_at(Stage stage) const;
    std::vector<DiagnosticEvent> events_for_draw(std::uint64_t draw_id) const;

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<std::uint64_t> open_draws_;
    std::uint64_t next_draw_id_ = 1;
};

// Null-safe helper for code paths that take an optional emitter
inline void emit_to(DiagnosticEmitter* emitter, Severity severity, Stage stage,
                    const std::string& message) {
    if (emitter) emitter->emit(severity, stage, message);
}

// Opens a draw on |emitter| (if any) for the lifetime of the scope
class DrawScope {
public:
    explicit DrawScope(DiagnosticEmitter* emitter)
        : emitter_(emitter), id_(emitter ? emitter->begin_draw() : 0) {}
    ~DrawScope() {
        if (emitter_) emitter_->end_draw();
    }
    DrawScope(const DrawScope&) = delete;
    DrawScope& operator=(const DrawScope&) = delete;

    std::uint64_t id() const { return id_; }

private:
    DiagnosticEmitter* emitter_;
    std::uint64_t id_;
};

}  // namespace neumorph::core
