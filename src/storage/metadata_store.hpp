// File: src/storage/metadata_store.hpp
#pragma once

#include "cluster/neuron_cluster.hpp"
#include "core/load_result.hpp"
#include "core/types.hpp"
#include "synapse/synapse.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace engram {

/// Region code -> clusters registered under it
using RegionMap = std::map<RegionCode, std::set<ClusterID>>;

/// MetadataStore: SQLite home of the small, structured families
///
/// Tables: cluster_index, region_map, concept_capacity, feature_map,
/// synapses, id_counters, schema_info. Each Save call replaces (or upserts) one family
/// inside a single transaction, so a failure leaves the previous durable
/// state intact. Loads report kAbsent for an empty family and kCorrupt for
/// a query failure or an undecodable row.
class MetadataStore {
public:
    static constexpr int kSchemaVersion = 1;

    struct Config {
        Config() = default;

        /// Path to the SQLite database file
        std::string db_path{"metadata.db"};

        /// Write-ahead logging
        bool enable_wal{true};

        /// FULL, NORMAL or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or has
    ///         an unsupported schema version
    explicit MetadataStore(const Config& config);
    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // ========================================================================
    // Cluster index (upsert)
    // ========================================================================

    bool SaveClusterIndex(const std::vector<ClusterSummary>& summaries);
    LoadResult<std::vector<ClusterSummary>> LoadClusterIndex() const;
    size_t CountClusters() const;

    // ========================================================================
    // Replaced families
    // ========================================================================

    bool SaveRegionMap(const RegionMap& regions);
    LoadResult<RegionMap> LoadRegionMap() const;

    bool SaveCapacities(const std::map<std::string, int>& capacities);
    LoadResult<std::map<std::string, int>> LoadCapacities() const;

    bool SaveFeatureMap(const std::map<std::string, FeatureID>& features);
    LoadResult<std::map<std::string, FeatureID>> LoadFeatureMap() const;

    bool SaveSynapses(const std::vector<Synapse>& synapses);
    LoadResult<std::vector<Synapse>> LoadSynapses() const;

    /// Identifier high-water marks by generator name ("cluster", "neuron", ...)
    bool SaveCounters(const std::map<std::string, uint64_t>& counters);
    LoadResult<std::map<std::string, uint64_t>> LoadCounters() const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    int GetSchemaVersion() const;
    size_t GetDatabaseSize() const;
    const std::string& GetPath() const { return config_.db_path; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    using RowBinder = std::function<bool(sqlite3_stmt*, size_t)>;

    void InitializeDatabase();
    void CreateTables();
    bool ExecuteSQL(const std::string& sql) const;

    bool BeginTransaction();
    bool CommitTransaction();
    void RollbackTransaction();

    /// Run `delete_sql` (may be null) then `insert_sql` once per row, all
    /// in one transaction. Caller holds mutex_.
    bool WriteFamily(const char* family, const char* delete_sql, const char* insert_sql,
                     size_t row_count, const RowBinder& bind);

    void LogError(const std::string& what) const;
};

} // namespace engram
