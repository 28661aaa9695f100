#include "boshpp/bosh/owner_mailbox.hpp"

namespace boshpp {

bool OwnerMailbox::deliver(OwnerEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<OwnerEvent> OwnerMailbox::receive() {
    std::unique_lock<std::mutex> lock(mutex_);

    cv_.wait(lock, [this]() {
        const bool has_event = (events_.empty() == false);
        return has_event || closed_;
    });

    return pop_locked();
}

std::optional<OwnerEvent> OwnerMailbox::receive_with_timeout(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    const bool ready = cv_.wait_for(lock, timeout, [this]() {
        const bool has_event = (events_.empty() == false);
        return has_event || closed_;
    });

    if (ready == false) {
        return std::nullopt;
    }
    return pop_locked();
}

std::optional<OwnerEvent> OwnerMailbox::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_locked();
}

void OwnerMailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool OwnerMailbox::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t OwnerMailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::optional<OwnerEvent> OwnerMailbox::pop_locked() {
    if (events_.empty()) {
        return std::nullopt;
    }
    OwnerEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

}  // namespace boshpp
