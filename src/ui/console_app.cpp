#include "ui/console_app.hpp"

#include <iostream>
#include <optional>
#include <thread>

// Constructor
ConsoleApp::ConsoleApp(MainLoop& loop,
                       StateContainer& state,
                       RecognitionEventRouter& router,
                       ConsoleConsent& consent,
                       TerminalView& view)
    : loop_(loop), router_(router), consent_(consent), view_(view), states_(state.observe()) {
    router_.setTextSink([this](const std::string& text) { view_.showText(text); });
    router_.setNoticeSink([this](const std::string& notice) { view_.showNotice(notice); });
}

void ConsoleApp::run(std::istream& in) {
    std::thread ui([this] { loop_.run([this] { refresh(); }); });
    loop_.post([this] { refresh(); });

    std::string line;
    while (std::getline(in, line)) {
        if (line == "q" || line == "quit") break;
        loop_.post([this, line] { handleLine(line); });
    }

    // Queued behind any pending input so it is all handled first
    loop_.post([this] {
        router_.stopRecording();
        loop_.quit();
    });
    ui.join();
}

void ConsoleApp::handleLine(const std::string& line) {
    if (consent_.awaitingAnswer()) {
        consent_.answer(line);
        return;
    }

    if (!line.empty()) {
        view_.showNotice("Press enter to start or stop recording, q to quit.");
        return;
    }

    if (!view_.controlEnabled()) {
        std::cout << "[Console] Control is disabled" << std::endl;
        return;
    }
    router_.toggleRecording();
}

void ConsoleApp::refresh() {
    while (std::optional<AppState> state = states_.poll()) {
        view_.render(*state, router_.transcript());
    }
}
