// File: src/storage/metadata_store.cpp
#include "storage/metadata_store.hpp"
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>

namespace engram {

namespace {

std::vector<float> ReadFloatBlob(sqlite3_stmt* stmt, int column) {
    const void* data = sqlite3_column_blob(stmt, column);
    int bytes = sqlite3_column_bytes(stmt, column);
    if (data == nullptr || bytes <= 0) {
        return {};
    }
    if (bytes % static_cast<int>(sizeof(float)) != 0) {
        throw std::runtime_error("centroid blob has odd size");
    }
    std::vector<float> values(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(values.data(), data, static_cast<size_t>(bytes));
    return values;
}

std::string ReadText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

MetadataStore::MetadataStore(const Config& config)
    : config_(config) {
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open metadata database " + config_.db_path + ": " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

MetadataStore::~MetadataStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void MetadataStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT version FROM schema_info LIMIT 1;", -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to read schema version");
    }
    int rc = sqlite3_step(stmt);
    int version = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);

    if (version == 0) {
        if (!ExecuteSQL("INSERT INTO schema_info (version) VALUES (" + std::to_string(kSchemaVersion) + ");")) {
            throw std::runtime_error("Failed to record schema version");
        }
    } else if (version != kSchemaVersion) {
        throw std::runtime_error("Unsupported metadata schema version " + std::to_string(version));
    }
}

void MetadataStore::CreateTables() {
    const char* statements[] = {
        R"(CREATE TABLE IF NOT EXISTS schema_info (
               version INTEGER NOT NULL
           );)",
        R"(CREATE TABLE IF NOT EXISTS cluster_index (
               id INTEGER PRIMARY KEY,
               label TEXT NOT NULL,
               origin_region TEXT NOT NULL,
               partition_key TEXT NOT NULL,
               neuron_count INTEGER NOT NULL,
               pattern_count INTEGER NOT NULL,
               importance REAL NOT NULL,
               created INTEGER NOT NULL,
               last_access INTEGER NOT NULL,
               centroid BLOB
           );)",
        R"(CREATE TABLE IF NOT EXISTS region_map (
               region TEXT NOT NULL,
               cluster_id INTEGER NOT NULL,
               PRIMARY KEY (region, cluster_id)
           );)",
        R"(CREATE TABLE IF NOT EXISTS concept_capacity (
               concept_label TEXT PRIMARY KEY,
               target INTEGER NOT NULL
           );)",
        R"(CREATE TABLE IF NOT EXISTS feature_map (
               name TEXT PRIMARY KEY,
               id INTEGER NOT NULL
           );)",
        R"(CREATE TABLE IF NOT EXISTS synapses (
               source INTEGER NOT NULL,
               target INTEGER NOT NULL,
               weight REAL NOT NULL,
               age_hours REAL NOT NULL,
               coactivations INTEGER NOT NULL,
               created INTEGER NOT NULL,
               reinforced INTEGER NOT NULL,
               PRIMARY KEY (source, target)
           );)",
        R"(CREATE TABLE IF NOT EXISTS id_counters (
               name TEXT PRIMARY KEY,
               value INTEGER NOT NULL
           );)",
    };

    for (const char* sql : statements) {
        if (!ExecuteSQL(sql)) {
            throw std::runtime_error("Failed to create metadata tables");
        }
    }
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_cluster_label ON cluster_index(label);");
}

bool MetadataStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "MetadataStore: " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }
    return true;
}

void MetadataStore::LogError(const std::string& what) const {
    std::cerr << "MetadataStore: " << what << ": " << sqlite3_errmsg(db_) << std::endl;
}

bool MetadataStore::BeginTransaction() {
    return ExecuteSQL("BEGIN TRANSACTION;");
}

bool MetadataStore::CommitTransaction() {
    return ExecuteSQL("COMMIT;");
}

void MetadataStore::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

bool MetadataStore::WriteFamily(const char* family, const char* delete_sql, const char* insert_sql,
                                size_t row_count, const RowBinder& bind) {
    if (!BeginTransaction()) {
        LogError(std::string("cannot begin ") + family + " transaction");
        return false;
    }

    if (delete_sql && !ExecuteSQL(delete_sql)) {
        RollbackTransaction();
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogError(std::string("cannot prepare ") + family + " insert");
        RollbackTransaction();
        return false;
    }

    for (size_t row = 0; row < row_count; ++row) {
        if (!bind(stmt, row) || sqlite3_step(stmt) != SQLITE_DONE) {
            LogError(std::string("failed writing ") + family);
            sqlite3_finalize(stmt);
            RollbackTransaction();
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (!CommitTransaction()) {
        RollbackTransaction();
        return false;
    }
    return true;
}

// ============================================================================
// Cluster index
// ============================================================================

bool MetadataStore::SaveClusterIndex(const std::vector<ClusterSummary>& summaries) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT OR REPLACE INTO cluster_index (id, label, origin_region, partition_key, neuron_count, "
        "pattern_count, importance, created, last_access, centroid) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    return WriteFamily("cluster_index", nullptr, sql, summaries.size(),
        [&summaries](sqlite3_stmt* stmt, size_t row) {
            const ClusterSummary& s = summaries[row];
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(s.id.value()));
            sqlite3_bind_text(stmt, 2, s.label.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, s.origin_region.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, s.partition.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(s.neuron_count));
            sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(s.pattern_count));
            sqlite3_bind_double(stmt, 7, s.importance);
            sqlite3_bind_int64(stmt, 8, s.created_at.ToMicros());
            sqlite3_bind_int64(stmt, 9, s.last_access.ToMicros());
            if (s.centroid && !s.centroid->Empty()) {
                const auto& data = s.centroid->Data();
                sqlite3_bind_blob(stmt, 10, data.data(),
                                  static_cast<int>(data.size() * sizeof(float)), SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_null(stmt, 10);
            }
            return true;
        });
}

LoadResult<std::vector<ClusterSummary>> MetadataStore::LoadClusterIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT id, label, origin_region, partition_key, neuron_count, pattern_count, importance, "
        "created, last_access, centroid FROM cluster_index ORDER BY id;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return LoadResult<std::vector<ClusterSummary>>::Corrupt(sqlite3_errmsg(db_));
    }

    std::vector<ClusterSummary> summaries;
    int rc;
    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ClusterSummary s;
            s.id = ClusterID(static_cast<ClusterID::ValueType>(sqlite3_column_int64(stmt, 0)));
            s.label = ReadText(stmt, 1);
            s.origin_region = ReadText(stmt, 2);
            s.partition = ReadText(stmt, 3);
            s.neuron_count = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
            s.pattern_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
            s.importance = static_cast<float>(sqlite3_column_double(stmt, 6));
            s.created_at = Timestamp::FromMicros(sqlite3_column_int64(stmt, 7));
            s.last_access = Timestamp::FromMicros(sqlite3_column_int64(stmt, 8));
            std::vector<float> centroid = ReadFloatBlob(stmt, 9);
            if (!centroid.empty()) {
                s.centroid = FeatureVector(std::move(centroid));
            }
            summaries.push_back(std::move(s));
        }
    } catch (const std::exception& e) {
        sqlite3_finalize(stmt);
        return LoadResult<std::vector<ClusterSummary>>::Corrupt(e.what());
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return LoadResult<std::vector<ClusterSummary>>::Corrupt(sqlite3_errmsg(db_));
    }
    if (summaries.empty()) {
        return LoadResult<std::vector<ClusterSummary>>::Absent();
    }
    return LoadResult<std::vector<ClusterSummary>>::Loaded(std::move(summaries));
}

size_t MetadataStore::CountClusters() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cluster_index;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

// ============================================================================
// Region map
// ============================================================================

bool MetadataStore::SaveRegionMap(const RegionMap& regions) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<RegionCode, ClusterID>> rows;
    for (const auto& [region, clusters] : regions) {
        for (const auto& id : clusters) {
            rows.emplace_back(region, id);
        }
    }

    return WriteFamily("region_map", "DELETE FROM region_map;",
        "INSERT INTO region_map (region, cluster_id) VALUES (?, ?);", rows.size(),
        [&rows](sqlite3_stmt* stmt, size_t row) {
            sqlite3_bind_text(stmt, 1, rows[row].first.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(rows[row].second.value()));
            return true;
        });
}

LoadResult<RegionMap> MetadataStore::LoadRegionMap() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT region, cluster_id FROM region_map;", -1, &stmt, nullptr) != SQLITE_OK) {
        return LoadResult<RegionMap>::Corrupt(sqlite3_errmsg(db_));
    }

    RegionMap regions;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        regions[ReadText(stmt, 0)].insert(
            ClusterID(static_cast<ClusterID::ValueType>(sqlite3_column_int64(stmt, 1))));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return LoadResult<RegionMap>::Corrupt(sqlite3_errmsg(db_));
    }
    if (regions.empty()) {
        return LoadResult<RegionMap>::Absent();
    }
    return LoadResult<RegionMap>::Loaded(std::move(regions));
}

// ============================================================================
// Concept capacity
// ============================================================================

bool MetadataStore::SaveCapacities(const std::map<std::string, int>& capacities) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, int>> rows(capacities.begin(), capacities.end());
    return WriteFamily("concept_capacity", "DELETE FROM concept_capacity;",
        "INSERT INTO concept_capacity (concept_label, target) VALUES (?, ?);", rows.size(),
        [&rows](sqlite3_stmt* stmt, size_t row) {
            sqlite3_bind_text(stmt, 1, rows[row].first.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, rows[row].second);
            return true;
        });
}

LoadResult<std::map<std::string, int>> MetadataStore::LoadCapacities() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT concept_label, target FROM concept_capacity;", -1, &stmt, nullptr) != SQLITE_OK) {
        return LoadResult<std::map<std::string, int>>::Corrupt(sqlite3_errmsg(db_));
    }

    std::map<std::string, int> capacities;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        capacities[ReadText(stmt, 0)] = sqlite3_column_int(stmt, 1);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return LoadResult<std::map<std::string, int>>::Corrupt(sqlite3_errmsg(db_));
    }
    if (capacities.empty()) {
        return LoadResult<std::map<std::string, int>>::Absent();
    }
    return LoadResult<std::map<std::string, int>>::Loaded(std::move(capacities));
}

// ============================================================================
// Feature map
// ============================================================================

bool MetadataStore::SaveFeatureMap(const std::map<std::string, FeatureID>& features) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, FeatureID>> rows(features.begin(), features.end());
    return WriteFamily("feature_map", "DELETE FROM feature_map;",
        "INSERT INTO feature_map (name, id) VALUES (?, ?);", rows.size(),
        [&rows](sqlite3_stmt* stmt, size_t row) {
            sqlite3_bind_text(stmt, 1, rows[row].first.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(rows[row].second.value()));
            return true;
        });
}

LoadResult<std::map<std::string, FeatureID>> MetadataStore::LoadFeatureMap() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT name, id FROM feature_map;", -1, &stmt, nullptr) != SQLITE_OK) {
        return LoadResult<std::map<std::string, FeatureID>>::Corrupt(sqlite3_errmsg(db_));
    }

    std::map<std::string, FeatureID> features;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        features[ReadText(stmt, 0)] =
            FeatureID(static_cast<FeatureID::ValueType>(sqlite3_column_int64(stmt, 1)));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return LoadResult<std::map<std::string, FeatureID>>::Corrupt(sqlite3_errmsg(db_));
    }
    if (features.empty()) {
        return LoadResult<std::map<std::string, FeatureID>>::Absent();
    }
    return LoadResult<std::map<std::string, FeatureID>>::Loaded(std::move(features));
}

// ============================================================================
// Synapses
// ============================================================================

bool MetadataStore::SaveSynapses(const std::vector<Synapse>& synapses) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO synapses (source, target, weight, age_hours, coactivations, created, reinforced) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);";

    return WriteFamily("synapses", "DELETE FROM synapses;", sql, synapses.size(),
        [&synapses](sqlite3_stmt* stmt, size_t row) {
            const Synapse& s = synapses[row];
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(s.source.value()));
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(s.target.value()));
            sqlite3_bind_double(stmt, 3, s.weight);
            sqlite3_bind_double(stmt, 4, s.age_hours);
            sqlite3_bind_int64(stmt, 5, s.coactivation_count);
            sqlite3_bind_int64(stmt, 6, s.created_at.ToMicros());
            sqlite3_bind_int64(stmt, 7, s.last_reinforced.ToMicros());
            return true;
        });
}

LoadResult<std::vector<Synapse>> MetadataStore::LoadSynapses() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT source, target, weight, age_hours, coactivations, created, reinforced FROM synapses;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return LoadResult<std::vector<Synapse>>::Corrupt(sqlite3_errmsg(db_));
    }

    std::vector<Synapse> synapses;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Synapse s;
        s.source = NeuronID(static_cast<NeuronID::ValueType>(sqlite3_column_int64(stmt, 0)));
        s.target = NeuronID(static_cast<NeuronID::ValueType>(sqlite3_column_int64(stmt, 1)));
        s.weight = static_cast<float>(sqlite3_column_double(stmt, 2));
        s.age_hours = sqlite3_column_double(stmt, 3);
        s.coactivation_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 4));
        s.created_at = Timestamp::FromMicros(sqlite3_column_int64(stmt, 5));
        s.last_reinforced = Timestamp::FromMicros(sqlite3_column_int64(stmt, 6));
        synapses.push_back(s);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return LoadResult<std::vector<Synapse>>::Corrupt(sqlite3_errmsg(db_));
    }
    if (synapses.empty()) {
        return LoadResult<std::vector<Synapse>>::Absent();
    }
    return LoadResult<std::vector<Synapse>>::Loaded(std::move(synapses));
}

// ============================================================================
// Identifier counters
// ============================================================================

bool MetadataStore::SaveCounters(const std::map<std::string, uint64_t>& counters) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, uint64_t>> rows(counters.begin(), counters.end());
    return WriteFamily("id_counters", "DELETE FROM id_counters;",
        "INSERT INTO id_counters (name, value) VALUES (?, ?);", rows.size(),
        [&rows](sqlite3_stmt* stmt, size_t row) {
            sqlite3_bind_text(stmt, 1, rows[row].first.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(rows[row].second));
            return true;
        });
}

LoadResult<std::map<std::string, uint64_t>> MetadataStore::LoadCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT name, value FROM id_counters;", -1, &stmt, nullptr) != SQLITE_OK) {
        return LoadResult<std::map<std::string, uint64_t>>::Corrupt(sqlite3_errmsg(db_));
    }

    std::map<std::string, uint64_t> counters;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        counters[ReadText(stmt, 0)] = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return LoadResult<std::map<std::string, uint64_t>>::Corrupt(sqlite3_errmsg(db_));
    }
    if (counters.empty()) {
        return LoadResult<std::map<std::string, uint64_t>>::Absent();
    }
    return LoadResult<std::map<std::string, uint64_t>>::Loaded(std::move(counters));
}

// ============================================================================
// Maintenance
// ============================================================================

int MetadataStore::GetSchemaVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT version FROM schema_info LIMIT 1;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

size_t MetadataStore::GetDatabaseSize() const {
    size_t total = 0;
    struct stat st;
    for (const std::string& suffix : {std::string(), std::string("-wal")}) {
        std::string path = config_.db_path + suffix;
        if (stat(path.c_str(), &st) == 0) {
            total += static_cast<size_t>(st.st_size);
        }
    }
    return total;
}

} // namespace engram
