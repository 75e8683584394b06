// ZKDROP - Airdrop Service Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/service.h>
#include <zkdrop/util/config.h>
#include <zkdrop/util/logging.h>

#include <filesystem>
#include <stdexcept>

namespace zkdrop {
namespace airdrop {

// ============================================================================
// Options
// ============================================================================

std::optional<AirdropService::Options> AirdropService::Options::FromConfig(
    const util::ConfigManager& config, std::string* error) {
    auto fail = [error](const std::string& msg) -> std::optional<Options> {
        if (error) *error = msg;
        return std::nullopt;
    };
    
    Options options;
    options.dataDir = config.GetPath(util::ConfigKeys::DATADIR,
                                     util::ConfigManager::GetDefaultDataDir());
    
    auto contract = config.TryGetString(util::ConfigKeys::CONTRACT);
    if (contract) {
        try {
            options.contract = Address::FromHex(*contract);
        } catch (const std::invalid_argument& e) {
            return fail("invalid contract address '" + *contract + "': " + e.what());
        }
    }
    
    if (config.HasKey(util::ConfigKeys::MEMORY)) {
        auto memory = config.TryGetBool(util::ConfigKeys::MEMORY);
        if (!memory) {
            return fail("invalid boolean for memory");
        }
        options.inMemory = *memory;
    }
    
    if (config.HasKey(util::ConfigKeys::DBCACHE)) {
        auto cache = config.TryGetUInt(util::ConfigKeys::DBCACHE);
        if (!cache || *cache == 0) {
            return fail("dbcache must be a positive number of MiB");
        }
        options.dbCacheMiB = static_cast<size_t>(*cache);
    }
    
    return options;
}

// ============================================================================
// Construction
// ============================================================================

AirdropService::AirdropService(const Address& contract,
                               ProofVerifier& verifier,
                               TokenTransferAdapter& token)
    : AirdropService(contract, nullptr, verifier, token) {}

AirdropService::AirdropService(const Address& contract,
                               std::unique_ptr<db::Database> db,
                               ProofVerifier& verifier,
                               TokenTransferAdapter& token)
    : db_(std::move(db))
    , registry_(db_.get(), &events_)
    , ledger_(db_.get())
    , engine_(contract, registry_, ledger_, verifier, token, &events_) {}

AirdropService::~AirdropService() = default;

std::pair<db::Status, std::unique_ptr<AirdropService>> AirdropService::Open(
    const Options& options,
    ProofVerifier& verifier,
    TokenTransferAdapter& token) {
    std::unique_ptr<db::Database> database;
    
    if (options.inMemory) {
        database = db::OpenMemoryDatabase();
    } else {
        if (options.dataDir.empty()) {
            return {db::Status::InvalidArgument("no data directory"), nullptr};
        }
        db::Options dbOptions;
        dbOptions.block_cache_size = options.dbCacheMiB * 1024 * 1024;
        
        std::filesystem::path path = std::filesystem::path(options.dataDir) / "airdrops";
        auto [status, opened] = db::OpenDatabase(path, dbOptions);
        if (!status.ok()) {
            return {status, nullptr};
        }
        database = std::move(opened);
    }
    
    std::unique_ptr<AirdropService> service(
        new AirdropService(options.contract, std::move(database), verifier, token));
    db::Status s = service->Load();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::AIRDROP) << "Failed to load airdrop state: "
                                              << s.ToString();
        return {s, nullptr};
    }
    
    LOG_INFO(util::LogCategory::AIRDROP) << "Opened airdrop service for "
                                         << options.contract.ToString() << " ("
                                         << service->StorageName() << ", "
                                         << service->registry_.Size() << " airdrops, "
                                         << service->ledger_.Size() << " nullifiers)";
    return {db::Status::Ok(), std::move(service)};
}

db::Status AirdropService::Load() {
    if (!db_) {
        return db::Status::Ok();
    }
    
    const std::string versionKey = db::MakeKey(db::prefix::VERSION);
    std::string stored;
    db::Status s = db_->Get(versionKey, &stored);
    if (s.IsNotFound()) {
        DataStream ss;
        ss << DB_VERSION;
        s = db_->Put(versionKey, ss.Str());
        if (!s.ok()) {
            return s;
        }
    } else if (!s.ok()) {
        return s;
    } else {
        uint32_t version = 0;
        try {
            DataStream ss(stored);
            ss >> version;
        } catch (const std::ios_base::failure& e) {
            return db::Status::Corruption(std::string("schema version: ") + e.what());
        }
        if (version != DB_VERSION) {
            return db::Status::NotSupported("schema version " + std::to_string(version));
        }
    }
    
    s = registry_.Load();
    if (!s.ok()) {
        return s;
    }
    return ledger_.Load();
}

// ============================================================================
// Operations
// ============================================================================

std::pair<AirdropStatus, AirdropId> AirdropService::CreateAirdrop(const Address& caller,
                                                                  GroupId groupId,
                                                                  const Address& token,
                                                                  const Address& holder,
                                                                  Amount amount) {
    return registry_.Create(caller, groupId, token, holder, amount);
}

AirdropStatus AirdropService::Claim(AirdropId airdropId,
                                    const Address& receiver,
                                    const FieldElement& root,
                                    const NullifierHash& nullifierHash,
                                    const SemaphoreProof& proof) {
    return engine_.Claim(airdropId, receiver, root, nullifierHash, proof);
}

AirdropStatus AirdropService::UpdateDetails(const Address& caller,
                                            AirdropId airdropId,
                                            const AirdropRecord& record) {
    return registry_.Update(caller, airdropId, record);
}

std::optional<AirdropRecord> AirdropService::GetAirdrop(AirdropId airdropId) const {
    return registry_.Get(airdropId);
}

bool AirdropService::IsNullifierUsed(const NullifierHash& nullifier) const {
    return ledger_.IsUsed(nullifier);
}

AirdropId AirdropService::NextAirdropId() const {
    return registry_.NextId();
}

std::string AirdropService::StorageName() const {
    return db_ ? db_->Name() : "none";
}

} // namespace airdrop
} // namespace zkdrop
