// File: src/storage/brain_storage.hpp
#pragma once

#include "cluster/neuron_cluster.hpp"
#include "core/load_result.hpp"
#include "quantization/codebook_quantizer.hpp"
#include "stats/activation_stats.hpp"
#include "storage/bank_cache.hpp"
#include "storage/metadata_store.hpp"
#include "storage/partitioner.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace engram {

/// Membership file content: the cluster summary plus its neuron ids
struct ClusterMembership {
    ClusterSummary summary;
    std::vector<NeuronID> neuron_ids;
};

/// BrainStorage: Durable home of everything the engine learns
///
/// Layout under root_path:
///   metadata.db                                   SQLite families
///   codebook.bin, activation_stats.bin            snapshots
///   partitions/<domain>/shard_NN/cluster_<id>.bin membership
///   partitions/<domain>/shard_NN/bank.bin         neuron bank
///
/// Every file is written atomically. Partitions are written in parallel,
/// each by exactly one task.
class BrainStorage {
public:
    struct Config {
        Config() = default;
        std::string root_path{"engram_data"};
        size_t max_concurrent_writes{4};
        size_t partition_shards{16};
        size_t bank_cache_size{32};
        bool enable_wal{true};
        std::string synchronous{"NORMAL"};
        bool verbose{false};
    };

    struct StorageStats {
        size_t cluster_count{0};
        size_t partition_count{0};
        uint64_t total_bytes{0};
        uint64_t metadata_bytes{0};
        BankCache::Stats bank_cache;
    };

    struct PartitionStats {
        std::string partition;
        size_t cluster_files{0};
        size_t bank_neurons{0};
        uint64_t total_bytes{0};
    };

    /// @throws std::runtime_error if the root cannot be created or the
    ///         metadata database cannot be opened
    explicit BrainStorage(const Config& config);

    // ========================================================================
    // Clusters
    // ========================================================================

    /// Partition key for a new cluster
    std::string AssignPartition(ClusterID id, const std::string& label) const;

    /// Write membership files and neuron banks of loaded clusters
    ///
    /// Clusters are grouped by partition; each partition bank is rewritten
    /// once with the clusters' neurons merged into it.
    /// @return Ids of the clusters whose partition write succeeded
    std::vector<ClusterID> SaveClusters(const std::vector<const NeuronCluster*>& clusters);

    /// Hydrate the members of one cluster from its partition
    LoadResult<std::vector<Neuron>> LoadCluster(ClusterID id, const std::string& partition);

    /// Read a membership file
    LoadResult<ClusterMembership> LoadMembership(ClusterID id, const std::string& partition) const;

    // ========================================================================
    // Snapshots
    // ========================================================================

    bool SaveCodebook(const CodebookSnapshot& snapshot);
    LoadResult<CodebookSnapshot> LoadCodebook() const;

    bool SaveActivationStats(const ActivationStats& stats);
    LoadResult<ActivationStats> LoadActivationStats(const ActivationStats::Config& config) const;

    // ========================================================================
    // Metadata families
    // ========================================================================

    MetadataStore& Metadata() { return *metadata_; }
    const MetadataStore& Metadata() const { return *metadata_; }

    // ========================================================================
    // Statistics
    // ========================================================================

    StorageStats GetStorageStats() const;
    std::vector<PartitionStats> GetPartitionStats() const;

    const std::filesystem::path& GetRoot() const { return root_; }
    std::filesystem::path PartitionDirectory(const std::string& partition) const;
    std::filesystem::path MembershipPath(ClusterID id, const std::string& partition) const;
    std::filesystem::path BankPath(const std::string& partition) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::filesystem::path root_;
    Partitioner partitioner_;
    std::unique_ptr<MetadataStore> metadata_;
    mutable BankCache bank_cache_;

    /// Bank of a partition from the cache or disk
    LoadResult<BankCache::BankPtr> GetBank(const std::string& partition) const;

    bool WritePartition(const std::string& partition,
                        const std::vector<const NeuronCluster*>& clusters);
};

} // namespace engram
