#include <neumorph/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace neumorph::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::ResolveStyle:   return "resolve_style";
        case Stage::ParseStyle:     return "parse";
        case Stage::ResolveOutline: return "resolve_outline";
        case Stage::Render:         return "render";
    }
    return "unknown";
}

const char* stage_module(Stage stage) {
    switch (stage) {
        case Stage::ResolveStyle:
        case Stage::ParseStyle:
            return "style";
        case Stage::ResolveOutline:
        case Stage::Render:
            return "shadow";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] "
        << stage_module(event.stage) << "/" << stage_name(event.stage);
    if (event.draw_id != 0) {
        oss << " (draw " << event.draw_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, Stage stage, const std::string& message) {
    DiagnosticEvent event;
    event.severity = severity;
    event.stage = stage;
    event.message = message;
    event.draw_id = current_draw();
    events_.push_back(event);
}

std::uint64_t DiagnosticEmitter::begin_draw() {
    std::uint64_t id = next_draw_id_++;
    open_draws_.push_back(id);
    return id;
}

void DiagnosticEmitter::end_draw() {
    if (!open_draws_.empty()) open_draws_.pop_back();
}

std::uint64_t DiagnosticEmitter::current_draw() const {
    return open_draws_.empty() ? 0 : open_draws_.back();
}

namespace {

template <typename Pred>
std::vector<DiagnosticEvent> select(const std::vector<DiagnosticEvent>& events, Pred pred) {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events.begin(), events.end(), std::back_inserter(result), pred);
    return result;
}

} // anonymous namespace

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select(events_, [severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_at(Stage stage) const {
    return select(events_, [stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_draw(std::uint64_t draw_id) const {
    return select(events_, [draw_id](const DiagnosticEvent& e) { return e.draw_id == draw_id; });
}

void DiagnosticEmitter::clear() {
    events_.clear();
    open_draws_.clear();
    next_draw_id_ = 1;
}

}  // namespace neumorph::core
