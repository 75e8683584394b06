// ZKDROP - Airdrop Registry Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/registry.h>
#include <zkdrop/util/logging.h>

#include <array>

namespace zkdrop {
namespace airdrop {

namespace {

std::string EncodeCounter(AirdropId next) {
    DataStream ss;
    ss << next;
    return ss.Str();
}

} // namespace

AirdropRegistry::AirdropRegistry(AirdropEventHub* events)
    : db_(nullptr), events_(events) {}

AirdropRegistry::AirdropRegistry(db::Database* db, AirdropEventHub* events)
    : db_(db), events_(events) {}

std::string AirdropRegistry::MakeDbKey(AirdropId id) {
    // Big-endian so records iterate in id order
    std::array<Byte, 8> bytes;
    for (size_t i = 0; i < 8; ++i) {
        bytes[7 - i] = static_cast<Byte>(id >> (8 * i));
    }
    return db::MakeKey(db::prefix::AIRDROP, bytes);
}

db::Status AirdropRegistry::Load() {
    if (!db_) {
        return db::Status::Ok();
    }
    
    AirdropId nextId = FIRST_AIRDROP_ID;
    std::string counter;
    db::Status s = db_->Get(db::MakeKey(db::prefix::COUNTER), &counter);
    if (s.ok()) {
        try {
            DataStream ss(counter);
            ss >> nextId;
        } catch (const std::ios_base::failure& e) {
            return db::Status::Corruption(std::string("airdrop counter: ") + e.what());
        }
        if (nextId < FIRST_AIRDROP_ID) {
            return db::Status::Corruption("airdrop counter below 1");
        }
    } else if (!s.IsNotFound()) {
        return s;
    }
    
    std::map<AirdropId, AirdropRecord> records;
    const std::string start = db::MakeKey(db::prefix::AIRDROP);
    auto it = db_->NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        db::Slice key = it->key();
        if (key.size() != 1 + 8) {
            return db::Status::Corruption("bad airdrop key length");
        }
        AirdropId id = 0;
        for (size_t i = 1; i < key.size(); ++i) {
            id = (id << 8) | static_cast<Byte>(key[i]);
        }
        auto record = AirdropRecord::Decode(it->value().ToString());
        if (!record) {
            return db::Status::Corruption("undecodable airdrop record " + std::to_string(id));
        }
        if (id == 0 || id >= nextId) {
            return db::Status::Corruption("airdrop " + std::to_string(id) +
                                          " beyond counter " + std::to_string(nextId));
        }
        records.emplace(id, *record);
    }
    if (!it->status().ok()) {
        return it->status();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(records);
    nextId_ = nextId;
    LOG_INFO(util::LogCategory::REGISTRY) << "Loaded " << records_.size()
                                          << " airdrops, next id " << nextId_;
    return db::Status::Ok();
}

std::pair<AirdropStatus, AirdropId> AirdropRegistry::Create(const Address& caller,
                                                            GroupId groupId,
                                                            const Address& token,
                                                            const Address& holder,
                                                            Amount amount) {
    AirdropRecord record;
    record.groupId = groupId;
    record.token = token;
    record.manager = caller;
    record.holder = holder;
    record.amount = amount;
    
    AirdropId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_;
        
        if (db_) {
            db::WriteBatch batch;
            batch.Put(MakeDbKey(id), record.Encode());
            batch.Put(db::MakeKey(db::prefix::COUNTER), EncodeCounter(id + 1));
            db::Status s = db_->Write(&batch);
            if (!s.ok()) {
                LOG_ERROR(util::LogCategory::REGISTRY) << "Failed to persist airdrop "
                                                       << id << ": " << s.ToString();
                return {AirdropStatus::StorageError(s.ToString()), 0};
            }
        }
        
        records_.emplace(id, record);
        nextId_ = id + 1;
    }
    
    LOG_INFO(util::LogCategory::REGISTRY) << "Created airdrop " << id << " "
                                          << record.ToString();
    if (events_) {
        events_->NotifyCreated(AirdropCreated{id, record});
    }
    return {AirdropStatus::Ok(), id};
}

std::optional<AirdropRecord> AirdropRegistry::Get(AirdropId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AirdropStatus AirdropRegistry::Update(const Address& caller, AirdropId id,
                                      const AirdropRecord& record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        
        // A missing record has no manager anyone can match
        if (it == records_.end() || it->second.manager != caller) {
            LOG_DEBUG(util::LogCategory::REGISTRY) << "Rejected update of airdrop " << id
                                                   << " by " << caller.ToString();
            return AirdropStatus::Unauthorized(
                "caller " + caller.ToString() + " does not manage airdrop " +
                std::to_string(id));
        }
        
        if (db_) {
            db::Status s = db_->Put(MakeDbKey(id), record.Encode());
            if (!s.ok()) {
                LOG_ERROR(util::LogCategory::REGISTRY) << "Failed to persist airdrop "
                                                       << id << ": " << s.ToString();
                return AirdropStatus::StorageError(s.ToString());
            }
        }
        
        it->second = record;
    }
    
    LOG_INFO(util::LogCategory::REGISTRY) << "Updated airdrop " << id << " "
                                          << record.ToString();
    if (events_) {
        events_->NotifyUpdated(AirdropUpdated{id, record});
    }
    return AirdropStatus::Ok();
}

AirdropId AirdropRegistry::NextId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_;
}

size_t AirdropRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace airdrop
} // namespace zkdrop
