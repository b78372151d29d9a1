#include "ui/terminal_view.hpp"

#include <utility>

TerminalView::Controls TerminalView::describe(const AppState& state, const std::string& transcript) {
    Controls c;
    switch (state.kind) {
        case AppState::Kind::Loading:
            c.buttonLabel = "Loading Model...";
            c.buttonEnabled = false;
            c.progressVisible = true;
            c.text = "Please wait...";
            break;
        case AppState::Kind::Ready:
            c.buttonLabel = "Start Recording";
            c.buttonEnabled = true;
            c.text = transcript.empty() ? "Your transcribed text will appear here..." : transcript;
            break;
        case AppState::Kind::Recording:
            c.buttonLabel = "Stop Recording";
            c.buttonEnabled = true;
            c.text = "Listening...";
            break;
        case AppState::Kind::PartialResult:
        case AppState::Kind::Result:
            c.buttonLabel = "Stop Recording";
            c.buttonEnabled = true;
            c.text = state.text;
            break;
        case AppState::Kind::Error:
            c.buttonLabel = "Error";
            c.buttonEnabled = false;
            c.text = state.text;
            break;
    }
    return c;
}

// Constructor
TerminalView::TerminalView(std::ostream& out) : out_(out) {}

void TerminalView::render(const AppState& state, const std::string& transcript) {
    Controls next = describe(state, transcript);
    if (rendered_ && next == current_) return;

    current_ = std::move(next);
    rendered_ = true;

    out_ << "[" << current_.buttonLabel << (current_.buttonEnabled ? "" : " (disabled)") << "]";
    if (current_.progressVisible) out_ << " ...";
    out_ << " " << current_.text << std::endl;
}

void TerminalView::showText(const std::string& text) {
    current_.text = text;
    out_ << "> " << text << std::endl;
}

void TerminalView::showNotice(const std::string& notice) { out_ << "! " << notice << std::endl; }
