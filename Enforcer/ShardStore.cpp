#include "ShardStore.h"
#include "AuditLog.h"
#include <fstream>
#include <iterator>
#include <filesystem>   // For directory and file operations (C++17)

namespace fs = std::filesystem;

namespace {
const char* kComponent = "ShardStore";
}

FileShardStore::FileShardStore(const std::string& storagePath) : storagePath(storagePath) {
    if (this->storagePath.empty()) {
        return;
    }
    try {
        // This will create the directory if it doesn't exist.
        fs::create_directories(this->storagePath);
    } catch (const fs::filesystem_error& e) {
        AuditLog::error(kComponent, "Error creating storage directory " + this->storagePath + ": " + e.what());
    }
}

std::string FileShardStore::resolvePath(const std::string& shardId) const {
    fs::path path(shardId);
    if (path.is_absolute() || storagePath.empty()) {
        return path.string();
    }
    return (fs::path(storagePath) / path).string();
}

bool FileShardStore::shardExists(const std::string& shardId) const {
    std::error_code ec;
    return fs::is_regular_file(resolvePath(shardId), ec);
}

std::vector<unsigned char> FileShardStore::readAll(const std::string& shardId) const {
    const std::string path = resolvePath(shardId);

    std::error_code ec;
    if (!fs::exists(path, ec) || fs::is_directory(path, ec)) {
        throw ShardNotFoundError(shardId);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ShardIOError(shardId, "Could not open shard file " + path);
    }

    std::vector<unsigned char> content((std::istreambuf_iterator<char>(file)),
                                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ShardIOError(shardId, "Error while reading shard file " + path);
    }
    return content;
}

void FileShardStore::overwrite(const std::string& shardId, const std::vector<unsigned char>& data) {
    const std::string path = resolvePath(shardId);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw ShardIOError(shardId, "Could not open shard file " + path + " for writing");
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        throw ShardIOError(shardId, "Error while writing shard file " + path);
    }
}

bool FileShardStore::createShard(const std::string& shardId, const std::vector<unsigned char>& data) {
    // Check for duplicates
    if (shardExists(shardId)) {
        AuditLog::error(kComponent, "Shard '" + shardId + "' already exists.");
        return false;
    }

    try {
        fs::path parent = fs::path(resolvePath(shardId)).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        overwrite(shardId, data);
    } catch (const fs::filesystem_error& e) {
        AuditLog::error(kComponent, "Error creating shard " + shardId + ": " + e.what());
        return false;
    } catch (const ShardIOError& e) {
        AuditLog::error(kComponent, e.what());
        return false;
    }

    AuditLog::info(kComponent, "Successfully created shard: " + shardId);
    return true;
}
