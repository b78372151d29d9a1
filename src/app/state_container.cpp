#include "app/state_container.hpp"

#include <algorithm>
#include <utility>

// Subscription

StateContainer::Subscription::~Subscription() { close(); }

StateContainer::Subscription& StateContainer::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        close();
        channel_ = std::move(other.channel_);
    }
    return *this;
}

// Marks the channel closed so the container drops it on the next publish
void StateContainer::Subscription::close() {
    if (!channel_) return;
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        channel_->closed = true;
        channel_->pending.clear();
    }
    channel_->cv.notify_all();
    channel_.reset();
}

std::optional<AppState> StateContainer::Subscription::next() {
    if (!channel_) return std::nullopt;

    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [&] { return !channel_->pending.empty() || channel_->closed; });
    if (channel_->pending.empty()) return std::nullopt;

    AppState state = std::move(channel_->pending.front());
    channel_->pending.pop_front();
    return state;
}

std::optional<AppState> StateContainer::Subscription::poll() {
    if (!channel_) return std::nullopt;

    std::lock_guard<std::mutex> lock(channel_->mutex);
    if (channel_->pending.empty()) return std::nullopt;

    AppState state = std::move(channel_->pending.front());
    channel_->pending.pop_front();
    return state;
}

// StateContainer

// Constructor
StateContainer::StateContainer() : state_(AppState::loading()) {}

// Destructor. Wakes any reader blocked in next()
StateContainer::~StateContainer() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& weak : channels_) {
        if (auto channel = weak.lock()) {
            {
                std::lock_guard<std::mutex> channelLock(channel->mutex);
                channel->closed = true;
            }
            channel->cv.notify_all();
        }
    }
}

void StateContainer::setLoading() { replace(AppState::loading()); }

void StateContainer::setReady() { replace(AppState::ready()); }

void StateContainer::setRecording() { replace(AppState::recording()); }

void StateContainer::setPartialResult(const std::string& text) { replace(AppState::partialResult(text)); }

void StateContainer::setPartialResult(const char* text) {
    replace(AppState::partialResult(requireText(text, "setPartialResult")));
}

void StateContainer::setResult(const std::string& text) { replace(AppState::result(text)); }

void StateContainer::setResult(const char* text) { replace(AppState::result(requireText(text, "setResult"))); }

void StateContainer::setError(const std::string& message) { replace(AppState::error(message)); }

void StateContainer::setError(const char* message) { replace(AppState::error(requireText(message, "setError"))); }

// Opens a new subscription seeded with the current state
StateContainer::Subscription StateContainer::observe() {
    auto channel = std::make_shared<Channel>();

    std::lock_guard<std::mutex> lock(mutex_);
    channel->pending.push_back(state_);
    channels_.push_back(channel);
    return Subscription(std::move(channel));
}

AppState StateContainer::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

// Swaps in the new state and fans it out to every open channel
void StateContainer::replace(AppState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(next);

    channels_.erase(
        std::remove_if(channels_.begin(), channels_.end(),
                       [](const std::weak_ptr<Channel>& weak) {
                           auto channel = weak.lock();
                           if (!channel) return true;
                           std::lock_guard<std::mutex> channelLock(channel->mutex);
                           return channel->closed;
                       }),
        channels_.end());

    for (auto& weak : channels_) {
        auto channel = weak.lock();
        if (!channel) continue;
        {
            std::lock_guard<std::mutex> channelLock(channel->mutex);
            channel->pending.push_back(state_);
        }
        channel->cv.notify_one();
    }
}

const char* StateContainer::requireText(const char* text, const char* operation) {
    if (!text) throw InvalidInput(std::string(operation) + ": text must not be null");
    return text;
}
