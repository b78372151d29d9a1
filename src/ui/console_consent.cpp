#include "ui/console_consent.hpp"

#include <cctype>
#include <utility>

// Constructor
ConsoleConsent::ConsoleConsent(std::ostream& out, bool remembered, OnGranted onGranted)
    : out_(out), granted_(remembered), onGranted_(std::move(onGranted)) {}

void ConsoleConsent::request(Callback onResult) {
    pending_ = std::move(onResult);
    out_ << "Allow whispernotes to record audio from the microphone? [y/N] " << std::flush;
}

void ConsoleConsent::answer(const std::string& line) {
    if (!pending_) return;

    std::string reply;
    for (unsigned char c : line) {
        if (!std::isspace(c)) reply.push_back((char)std::tolower(c));
    }
    const bool yes = reply == "y" || reply == "yes";

    Callback callback = std::move(pending_);
    pending_ = nullptr;

    if (yes && !granted_) {
        granted_ = true;
        if (onGranted_) onGranted_();
    }
    callback(yes);
}
