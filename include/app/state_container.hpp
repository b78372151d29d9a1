#ifndef STATE_CONTAINER_HPP
#define STATE_CONTAINER_HPP

#include "app/app_state.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when a setter is handed a null text pointer.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// Single owned holder of AppState. Every setter replaces the state in full and
// notifies all live subscriptions; no transition is ever rejected.
class StateContainer {
    struct Channel {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<AppState> pending;
        bool closed = false;
    };

public:
    // A live view of the state stream. Starts with the state current at
    // subscription time, then receives every state set afterwards in order.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept = default;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        // Blocks until a state is available. Returns nullopt once the
        // container is gone and the backlog is drained.
        std::optional<AppState> next();

        // Non-blocking variant of next().
        std::optional<AppState> poll();

    private:
        friend class StateContainer;
        explicit Subscription(std::shared_ptr<Channel> channel) : channel_(std::move(channel)) {}

        void close();

        std::shared_ptr<Channel> channel_;
    };

    StateContainer();
    ~StateContainer();

    StateContainer(const StateContainer&) = delete;
    StateContainer& operator=(const StateContainer&) = delete;

    void setLoading();
    void setReady();
    void setRecording();

    void setPartialResult(const std::string& text);
    void setPartialResult(const char* text);
    void setResult(const std::string& text);
    void setResult(const char* text);
    void setError(const std::string& message);
    void setError(const char* message);

    Subscription observe();

    AppState current() const;

private:
    void replace(AppState next);

    static const char* requireText(const char* text, const char* operation);

    mutable std::mutex mutex_;
    AppState state_;
    std::vector<std::weak_ptr<Channel>> channels_;
};

#endif
