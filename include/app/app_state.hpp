#ifndef APP_STATE_HPP
#define APP_STATE_HPP

#include <string>
#include <utility>

// What the UI should display. Exactly one kind is active; text is the payload
// of PartialResult and Result, and the message of Error. It is empty otherwise.
struct AppState {
    enum class Kind {
        Loading,
        Ready,
        Recording,
        PartialResult,
        Result,
        Error
    };

    Kind kind = Kind::Loading;
    std::string text;

    static AppState loading() { return AppState{Kind::Loading, {}}; }
    static AppState ready() { return AppState{Kind::Ready, {}}; }
    static AppState recording() { return AppState{Kind::Recording, {}}; }
    static AppState partialResult(std::string text) { return AppState{Kind::PartialResult, std::move(text)}; }
    static AppState result(std::string text) { return AppState{Kind::Result, std::move(text)}; }
    static AppState error(std::string message) { return AppState{Kind::Error, std::move(message)}; }

    bool is(Kind k) const { return kind == k; }

    bool operator==(const AppState& other) const { return kind == other.kind && text == other.text; }
    bool operator!=(const AppState& other) const { return !(*this == other); }
};

#endif
