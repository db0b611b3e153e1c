#ifndef SHARD_STORE_H
#define SHARD_STORE_H

#include <string>
#include <vector>
#include <stdexcept>

// Thrown when a shard identifier does not resolve to existing content.
class ShardNotFoundError : public std::runtime_error {
public:
    explicit ShardNotFoundError(const std::string& shardId)
        : std::runtime_error("Shard not found: " + shardId), shardId_(shardId) {}
    const std::string& shardId() const { return shardId_; }

private:
    std::string shardId_;
};

// Thrown when shard content cannot be read or written.
class ShardIOError : public std::runtime_error {
public:
    ShardIOError(const std::string& shardId, const std::string& what)
        : std::runtime_error(what), shardId_(shardId) {}
    const std::string& shardId() const { return shardId_; }

private:
    std::string shardId_;
};

/**
 * @class ShardStore
 * @brief Read/overwrite access to named key-shard locations.
 */
class ShardStore {
public:
    virtual ~ShardStore() = default;

    /**
     * @brief Reads the entire content of a shard.
     * @throws ShardNotFoundError if the shard does not exist.
     * @throws ShardIOError if the shard exists but cannot be read.
     */
    virtual std::vector<unsigned char> readAll(const std::string& shardId) const = 0;

    /**
     * @brief Replaces the full content of a shard. There is no backup of the
     * previous content.
     * @throws ShardIOError on write failure.
     */
    virtual void overwrite(const std::string& shardId, const std::vector<unsigned char>& data) = 0;
};

/**
 * @class FileShardStore
 * @brief Shards stored as plain files. Relative identifiers resolve under
 * the storage directory, absolute identifiers are used as they are.
 */
class FileShardStore : public ShardStore {
public:
    /**
     * @brief Constructs the store, creating the storage directory if needed.
     * @param storagePath Root directory for relative shard identifiers. Empty
     * means the current working directory.
     */
    explicit FileShardStore(const std::string& storagePath = "");

    std::vector<unsigned char> readAll(const std::string& shardId) const override;
    void overwrite(const std::string& shardId, const std::vector<unsigned char>& data) override;

    /**
     * @brief Provisions a new shard.
     * @return false if the shard already exists or could not be written.
     */
    bool createShard(const std::string& shardId, const std::vector<unsigned char>& data);

    bool shardExists(const std::string& shardId) const;

    // Full filesystem path a shard identifier resolves to.
    std::string resolvePath(const std::string& shardId) const;

    const std::string& getStoragePath() const { return storagePath; }

private:
    std::string storagePath;
};

#endif // SHARD_STORE_H
