#ifndef TERMINAL_VIEW_HPP
#define TERMINAL_VIEW_HPP

#include "app/app_state.hpp"

#include <ostream>
#include <string>

// Renders AppState as a record/stop control, a progress indicator and a text
// area, one line per change.
class TerminalView {
public:
    struct Controls {
        std::string buttonLabel;
        bool buttonEnabled = false;
        bool progressVisible = false;
        std::string text;

        bool operator==(const Controls& other) const {
            return buttonLabel == other.buttonLabel && buttonEnabled == other.buttonEnabled &&
                   progressVisible == other.progressVisible && text == other.text;
        }
    };

    static Controls describe(const AppState& state, const std::string& transcript);

    explicit TerminalView(std::ostream& out);

    void render(const AppState& state, const std::string& transcript);
    void showText(const std::string& text);
    void showNotice(const std::string& notice);

    bool controlEnabled() const { return current_.buttonEnabled; }
    const Controls& current() const { return current_; }

private:
    std::ostream& out_;
    Controls current_;
    bool rendered_ = false;
};

#endif
