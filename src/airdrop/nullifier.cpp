// ZKDROP - Nullifier Ledger Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/nullifier.h>
#include <zkdrop/util/logging.h>

#include <stdexcept>

namespace zkdrop {
namespace airdrop {

const char* MarkResultToString(NullifierLedger::MarkResult result) {
    switch (result) {
        case NullifierLedger::MarkResult::Marked: return "Marked";
        case NullifierLedger::MarkResult::AlreadyUsed: return "AlreadyUsed";
        case NullifierLedger::MarkResult::StorageError: return "StorageError";
        default: return "Unknown";
    }
}

NullifierLedger::NullifierLedger() : db_(nullptr) {}

NullifierLedger::NullifierLedger(db::Database* db) : db_(db) {}

std::string NullifierLedger::MakeDbKey(const NullifierHash& nullifier) {
    return db::MakeKey(db::prefix::NULLIFIER, nullifier.ToBytes());
}

db::Status NullifierLedger::Load() {
    if (!db_) {
        return db::Status::Ok();
    }
    
    std::set<NullifierHash> loaded;
    const std::string start = db::MakeKey(db::prefix::NULLIFIER);
    
    auto it = db_->NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        db::Slice key = it->key();
        if (key.size() != 1 + 32) {
            return db::Status::Corruption("bad nullifier key length " +
                                          std::to_string(key.size()));
        }
        auto value = Uint256::FromBigEndian(
            reinterpret_cast<const Byte*>(key.data()) + 1, 32);
        auto nullifier = FieldElement::FromUint256(value);
        if (!nullifier) {
            return db::Status::Corruption("non-canonical nullifier " + value.ToHex());
        }
        loaded.insert(*nullifier);
    }
    
    if (!it->status().ok()) {
        return it->status();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    used_ = std::move(loaded);
    LOG_INFO(util::LogCategory::NULLIFIER) << "Loaded " << used_.size()
                                           << " consumed nullifiers";
    return db::Status::Ok();
}

bool NullifierLedger::IsUsed(const NullifierHash& nullifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_.count(nullifier) > 0;
}

db::Status NullifierLedger::InsertLocked(const NullifierHash& nullifier) {
    if (db_) {
        db::Status s = db_->Put(MakeDbKey(nullifier), db::Slice());
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::NULLIFIER) << "Failed to persist nullifier "
                                                    << nullifier.ToHex() << ": "
                                                    << s.ToString();
            return s;
        }
    }
    used_.insert(nullifier);
    return db::Status::Ok();
}

db::Status NullifierLedger::MarkUsed(const NullifierHash& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (used_.count(nullifier) > 0) {
        throw std::logic_error("nullifier already used: " + nullifier.ToHex());
    }
    return InsertLocked(nullifier);
}

NullifierLedger::MarkResult NullifierLedger::TryMarkUsed(const NullifierHash& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (used_.count(nullifier) > 0) {
        return MarkResult::AlreadyUsed;
    }
    if (!InsertLocked(nullifier).ok()) {
        return MarkResult::StorageError;
    }
    return MarkResult::Marked;
}

db::Status NullifierLedger::Release(const NullifierHash& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (used_.count(nullifier) == 0) {
        return db::Status::NotFound(nullifier.ToHex());
    }
    
    // Keep memory and disk in agreement: if the delete fails the
    // nullifier stays consumed in both places
    if (db_) {
        db::Status s = db_->Delete(MakeDbKey(nullifier));
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::NULLIFIER) << "Failed to release nullifier "
                                                    << nullifier.ToHex() << ": "
                                                    << s.ToString();
            return s;
        }
    }
    used_.erase(nullifier);
    return db::Status::Ok();
}

uint64_t NullifierLedger::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_.size();
}

} // namespace airdrop
} // namespace zkdrop
