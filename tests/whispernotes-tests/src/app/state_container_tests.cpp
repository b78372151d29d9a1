#include <catch2/catch_test_macros.hpp>

#include <app/state_container.hpp>

#include <thread>
#include <vector>

namespace state_container {

std::vector<AppState> drain(StateContainer::Subscription& sub) {
    std::vector<AppState> out;
    while (auto state = sub.poll()) out.push_back(*state);
    return out;
}

TEST_CASE("State container starts in Loading", "[state]") {
    StateContainer container;
    CHECK(container.current() == AppState::loading());
}

TEST_CASE("Subscription begins with the current state", "[state]") {
    StateContainer container;
    container.setReady();

    auto sub = container.observe();
    auto states = drain(sub);
    REQUIRE(states.size() == 1);
    CHECK(states[0] == AppState::ready());
}

TEST_CASE("Observers see every state in order, each replacing the last in full", "[state]") {
    StateContainer container;
    auto sub = container.observe();

    container.setReady();
    container.setRecording();
    container.setPartialResult("he");
    container.setResult("hello");
    container.setError("boom");
    container.setReady();

    const std::vector<AppState> expected{
        AppState::loading(),       AppState::ready(),       AppState::recording(), AppState::partialResult("he"),
        AppState::result("hello"), AppState::error("boom"), AppState::ready(),
    };
    CHECK(drain(sub) == expected);

    // The text of an earlier variant never leaks into a later one
    CHECK(container.current().text.empty());
}

TEST_CASE("Repeated identical calls leave the same state", "[state]") {
    StateContainer container;
    container.setRecording();
    container.setRecording();
    CHECK(container.current() == AppState::recording());

    container.setResult("x");
    container.setResult("x");
    CHECK(container.current() == AppState::result("x"));
}

TEST_CASE("Null text is rejected and the state is kept", "[state]") {
    StateContainer container;
    container.setResult("kept");
    auto sub = container.observe();
    drain(sub);

    const char* none = nullptr;
    CHECK_THROWS_AS(container.setPartialResult(none), InvalidInput);
    CHECK_THROWS_AS(container.setResult(none), InvalidInput);
    CHECK_THROWS_AS(container.setError(none), InvalidInput);

    CHECK(container.current() == AppState::result("kept"));
    CHECK(drain(sub).empty());
}

TEST_CASE("Empty text is allowed", "[state]") {
    StateContainer container;
    container.setPartialResult("");
    CHECK(container.current() == AppState::partialResult(""));
    container.setError("");
    CHECK(container.current() == AppState::error(""));
}

TEST_CASE("No transition is ever rejected", "[state]") {
    StateContainer container;
    container.setError("fatal");
    container.setRecording();
    CHECK(container.current() == AppState::recording());
}

TEST_CASE("Subscriptions are independent and restartable", "[state]") {
    StateContainer container;
    auto first = container.observe();
    container.setReady();

    auto second = container.observe();
    container.setRecording();

    CHECK(drain(first) == std::vector<AppState>{AppState::loading(), AppState::ready(), AppState::recording()});
    CHECK(drain(second) == std::vector<AppState>{AppState::ready(), AppState::recording()});

    auto again = container.observe();
    CHECK(drain(again) == std::vector<AppState>{AppState::recording()});
}

TEST_CASE("A dropped subscription stops receiving", "[state]") {
    StateContainer container;
    {
        auto sub = container.observe();
        container.setReady();
    }
    container.setRecording();
    CHECK(container.current() == AppState::recording());
}

TEST_CASE("next() blocks until a state arrives from another thread", "[state]") {
    StateContainer container;
    auto sub = container.observe();
    REQUIRE(sub.next() == AppState::loading());

    std::thread writer([&] { container.setReady(); });
    auto state = sub.next();
    writer.join();

    REQUIRE(state.has_value());
    CHECK(*state == AppState::ready());
}

TEST_CASE("next() ends once the container is destroyed", "[state]") {
    StateContainer::Subscription sub;
    {
        StateContainer container;
        sub = container.observe();
    }
    CHECK(sub.next() == AppState::loading());
    CHECK_FALSE(sub.next().has_value());
}

} // namespace state_container
