// ZKDROP - Airdrop Notifications Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/events.h>
#include <zkdrop/util/logging.h>

#include <algorithm>

namespace zkdrop {
namespace airdrop {

void AirdropEventHub::AddListener(IAirdropListener* listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(listener);
}

void AirdropEventHub::RemoveListener(IAirdropListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove(listeners_.begin(), listeners_.end(), listener),
        listeners_.end());
}

size_t AirdropEventHub::ListenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

std::vector<IAirdropListener*> AirdropEventHub::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_;
}

void AirdropEventHub::NotifyCreated(const AirdropCreated& event) const {
    LOG_DEBUG(util::LogCategory::AIRDROP) << "AirdropCreated(" << event.id << ")";
    for (auto* listener : Snapshot()) {
        listener->OnAirdropCreated(event);
    }
}

void AirdropEventHub::NotifyClaimed(const AirdropClaimed& event) const {
    LOG_DEBUG(util::LogCategory::AIRDROP) << "AirdropClaimed(" << event.id << ", "
                                          << event.receiver.ToString() << ")";
    for (auto* listener : Snapshot()) {
        listener->OnAirdropClaimed(event);
    }
}

void AirdropEventHub::NotifyUpdated(const AirdropUpdated& event) const {
    LOG_DEBUG(util::LogCategory::AIRDROP) << "AirdropUpdated(" << event.id << ")";
    for (auto* listener : Snapshot()) {
        listener->OnAirdropUpdated(event);
    }
}

} // namespace airdrop
} // namespace zkdrop
