#include "deadline.hpp"
#include "outline_errors.hpp"

#include <cstring>

document_deadline::document_deadline(std::chrono::steady_clock::duration budget) :
    budget_(budget),
    expiry_(std::chrono::steady_clock::now() + budget) {
    std::memset(&cookie_, 0, sizeof(cookie_));
}

void document_deadline::expire() {
    expired_.store(true);
    cookie_.abort = 1;
}

bool document_deadline::expired() const {
    return expired_.load() || std::chrono::steady_clock::now() >= expiry_;
}

void document_deadline::check(const std::string& stage) const {
    if (expired()) {
        auto seconds = std::chrono::duration_cast<std::chrono::milliseconds>(budget_).count() / 1000.0;
        throw document_timeout_error("document exceeded its " + std::to_string(seconds) + "s budget during " + stage);
    }
}
