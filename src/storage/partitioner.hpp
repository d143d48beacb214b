// File: src/storage/partitioner.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace engram {

/// Partitioner: Chooses the storage partition of a cluster
///
/// Key format is "<domain>/shard_NN" with NN = id % shards. The domain is
/// the first of sensory, motor, memory, association whose keywords occur in
/// the cluster label, else general. A cluster keeps its key for life.
class Partitioner {
public:
    struct Config {
        Config() = default;
        size_t shards{16};
    };

    Partitioner();
    explicit Partitioner(const Config& config);

    /// Domain for a concept label
    static std::string DomainFor(const std::string& label);

    /// Every domain name, in matching order
    static const std::vector<std::string>& Domains();

    size_t ShardFor(ClusterID id) const;

    std::string PartitionFor(ClusterID id, const std::string& label) const;

    size_t GetShardCount() const { return config_.shards; }

private:
    Config config_;
};

} // namespace engram
