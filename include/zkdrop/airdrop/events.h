// ZKDROP - Airdrop Notifications
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Observers for airdrop creation, claims and updates. Notifications never
// influence control flow.

#ifndef ZKDROP_AIRDROP_EVENTS_H
#define ZKDROP_AIRDROP_EVENTS_H

#include <zkdrop/airdrop/airdrop.h>

#include <mutex>
#include <vector>

namespace zkdrop {
namespace airdrop {

// ============================================================================
// Events
// ============================================================================

struct AirdropCreated {
    AirdropId id{0};
    AirdropRecord record;
};

struct AirdropClaimed {
    AirdropId id{0};
    Address receiver;
};

struct AirdropUpdated {
    AirdropId id{0};
    AirdropRecord record;
};

// ============================================================================
// Listener
// ============================================================================

/**
 * Listener for airdrop events. Called synchronously on the thread that
 * performed the operation, after the state change is committed.
 */
class IAirdropListener {
public:
    virtual ~IAirdropListener() = default;
    
    virtual void OnAirdropCreated(const AirdropCreated& event) {}
    
    virtual void OnAirdropClaimed(const AirdropClaimed& event) {}
    
    virtual void OnAirdropUpdated(const AirdropUpdated& event) {}
};

/// Fans events out to registered listeners (not owned)
class AirdropEventHub {
public:
    void AddListener(IAirdropListener* listener);
    void RemoveListener(IAirdropListener* listener);
    size_t ListenerCount() const;
    
    void NotifyCreated(const AirdropCreated& event) const;
    void NotifyClaimed(const AirdropClaimed& event) const;
    void NotifyUpdated(const AirdropUpdated& event) const;

private:
    /// Copy of the listener list so callbacks run without the lock held
    std::vector<IAirdropListener*> Snapshot() const;
    
    std::vector<IAirdropListener*> listeners_;
    mutable std::mutex mutex_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_EVENTS_H
