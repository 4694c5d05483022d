// AGORA - Database Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/db/database.h"
#include "agora/db/leveldb.h"
#include "agora/util/logging.h"

namespace agora {
namespace db {

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef AGORA_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    
    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Cannot open " << path.string()
                                            << ": " << s.ToString();
        return {ConvertStatus(s), nullptr};
    }
    
    LOG_INFO(util::LogCategory::STORE) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db)};
#else
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }
    
    LOG_WARN(util::LogCategory::STORE) << "Built without LevelDB, state at "
                                       << path.string() << " is kept in memory only";
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef AGORA_USE_LEVELDB
    return ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
#else
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace agora
