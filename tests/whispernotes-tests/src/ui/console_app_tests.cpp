#include <catch2/catch_test_macros.hpp>

#include <ui/console_app.hpp>

#include "fakes.hpp"

#include <memory>
#include <sstream>

namespace console_app {

using namespace fakes;

struct TestSubject {
    MainLoop loop;
    StateContainer state;
    FakeRecognizerFactory recognizers;
    ManualClock clock;
    std::ostringstream out;
    int grants = 0;
    ConsoleConsent consent;
    RecognitionEventRouter router;
    TerminalView view;
    ConsoleApp app;

    explicit TestSubject(bool remembered)
        : consent(out, remembered, [this] { ++grants; }),
          router(state, recognizers, consent, clock,
                 [this](std::function<void()> task) { loop.post(std::move(task)); }, {}),
          view(out),
          app(loop, state, router, consent, view) {}

    // Plays the part of the UI thread
    void settle() {
        loop.drain();
        app.refresh();
    }
};

TEST_CASE("Enter is ignored while the model loads", "[console]") {
    TestSubject s(true);
    s.settle();

    s.app.handleLine("");
    s.settle();
    CHECK(s.recognizers.starts == 0);
    CHECK(s.state.current() == AppState::loading());
}

TEST_CASE("Enter toggles recording once ready", "[console]") {
    TestSubject s(true);
    s.router.onModelReady(std::make_shared<FakeModel>());
    s.settle();

    s.app.handleLine("");
    s.settle();
    CHECK(s.state.current() == AppState::recording());
    CHECK(s.view.current().buttonLabel == "Stop Recording");

    s.app.handleLine("");
    s.settle();
    CHECK(s.state.current() == AppState::ready());
}

TEST_CASE("First recording asks for consent on the terminal", "[console]") {
    TestSubject s(false);
    s.router.onModelReady(std::make_shared<FakeModel>());
    s.settle();

    s.app.handleLine("");
    s.settle();
    CHECK(s.consent.awaitingAnswer());
    CHECK(s.out.str().find("[y/N]") != std::string::npos);
    CHECK(s.recognizers.starts == 0);

    SECTION("yes starts recording and is remembered") {
        s.app.handleLine("Y");
        s.settle();
        CHECK(s.recognizers.starts == 1);
        CHECK(s.grants == 1);
        CHECK(s.consent.granted());
    }

    SECTION("anything else denies") {
        s.app.handleLine("nope");
        s.settle();
        CHECK(s.recognizers.starts == 0);
        CHECK_FALSE(s.consent.granted());
        CHECK(s.state.current() == AppState::ready());
        CHECK(s.out.str().find("! Permission denied! Cannot record audio.") != std::string::npos);
    }
}

TEST_CASE("Transcript updates reach the terminal", "[console]") {
    TestSubject s(true);
    s.router.onModelReady(std::make_shared<FakeModel>());
    s.settle();
    s.app.handleLine("");
    s.settle();

    s.recognizers.listener->onResult(Hypothesis{"hello"});
    s.settle();
    CHECK(s.out.str().find("> hello \n") != std::string::npos);
}

TEST_CASE("run toggles on enter and stops on quit", "[console]") {
    TestSubject s(true);
    s.router.onModelReady(std::make_shared<FakeModel>());

    std::istringstream in("\nq\n");
    s.app.run(in);

    CHECK(s.recognizers.starts == 1);
    CHECK(s.recognizers.last()->stops == 1);
    CHECK(s.state.current() == AppState::ready());
}

} // namespace console_app
