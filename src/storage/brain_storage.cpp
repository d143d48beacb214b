// File: src/storage/brain_storage.cpp
#include "storage/brain_storage.hpp"
#include "storage/snapshot_file.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <map>
#include <stdexcept>

namespace engram {

BrainStorage::BrainStorage(const Config& config)
    : config_(config),
      root_(config.root_path),
      partitioner_([&config] {
          Partitioner::Config pc;
          pc.shards = config.partition_shards;
          return pc;
      }()),
      bank_cache_(config.bank_cache_size) {
    config_.max_concurrent_writes = std::max<size_t>(1, config_.max_concurrent_writes);

    std::error_code ec;
    std::filesystem::create_directories(root_ / "partitions", ec);
    if (ec) {
        throw std::runtime_error("Cannot create storage root " + root_.string() + ": " + ec.message());
    }

    MetadataStore::Config mc;
    mc.db_path = (root_ / "metadata.db").string();
    mc.enable_wal = config_.enable_wal;
    mc.synchronous = config_.synchronous;
    metadata_ = std::make_unique<MetadataStore>(mc);
}

// ============================================================================
// Paths
// ============================================================================

std::filesystem::path BrainStorage::PartitionDirectory(const std::string& partition) const {
    return root_ / "partitions" / partition;
}

std::filesystem::path BrainStorage::MembershipPath(ClusterID id, const std::string& partition) const {
    return PartitionDirectory(partition) / ("cluster_" + std::to_string(id.value()) + ".bin");
}

std::filesystem::path BrainStorage::BankPath(const std::string& partition) const {
    return PartitionDirectory(partition) / "bank.bin";
}

std::string BrainStorage::AssignPartition(ClusterID id, const std::string& label) const {
    return partitioner_.PartitionFor(id, label);
}

// ============================================================================
// Clusters
// ============================================================================

namespace {

NeuronBank ReadBank(std::istream& in) {
    uint64_t count = io::ReadPod<uint64_t>(in);
    NeuronBank bank;
    for (uint64_t i = 0; i < count; ++i) {
        Neuron neuron = Neuron::Deserialize(in);
        NeuronID id = neuron.GetID();
        bank.emplace(id, std::move(neuron));
    }
    return bank;
}

ClusterMembership ReadMembership(std::istream& in) {
    ClusterMembership membership;
    membership.summary = ClusterSummary::Deserialize(in);
    uint64_t count = io::ReadPod<uint64_t>(in);
    membership.neuron_ids.reserve(static_cast<size_t>(std::min<uint64_t>(count, 1u << 20)));
    for (uint64_t i = 0; i < count; ++i) {
        membership.neuron_ids.push_back(NeuronID::Deserialize(in));
    }
    return membership;
}

} // namespace

LoadResult<BankCache::BankPtr> BrainStorage::GetBank(const std::string& partition) const {
    if (auto cached = bank_cache_.Get(partition)) {
        return LoadResult<BankCache::BankPtr>::Loaded(cached);
    }

    auto result = ReadSnapshot<NeuronBank>(BankPath(partition), kNeuronBankMagic, kSnapshotVersion,
                                           ReadBank);
    if (!result.IsLoaded()) {
        if (result.IsCorrupt()) {
            return LoadResult<BankCache::BankPtr>::Corrupt(result.error);
        }
        return LoadResult<BankCache::BankPtr>::Absent();
    }

    auto bank = std::make_shared<const NeuronBank>(std::move(*result.value));
    bank_cache_.Put(partition, bank);
    return LoadResult<BankCache::BankPtr>::Loaded(bank);
}

bool BrainStorage::WritePartition(const std::string& partition,
                                  const std::vector<const NeuronCluster*>& clusters) {
    auto existing = GetBank(partition);
    auto bank = std::make_shared<NeuronBank>();
    if (existing.IsLoaded()) {
        *bank = **existing.value;
    } else if (existing.IsCorrupt()) {
        std::cerr << "BrainStorage: rebuilding corrupt bank of " << partition
                  << " (" << existing.error << ")" << std::endl;
    }

    std::vector<ClusterMembership> memberships;
    memberships.reserve(clusters.size());
    for (const NeuronCluster* cluster : clusters) {
        ClusterMembership membership;
        membership.summary = cluster->Summary();
        for (const auto& [id, neuron] : cluster->GetNeurons()) {
            membership.neuron_ids.push_back(id);
            (*bank)[id] = neuron;
        }
        memberships.push_back(std::move(membership));
    }

    // Bank first, so a membership file never names a neuron the bank lacks
    bool bank_written = WriteAtomically(BankPath(partition), kNeuronBankMagic, kSnapshotVersion,
        [&bank](std::ostream& out) {
            io::WritePod<uint64_t>(out, bank->size());
            for (const auto& [id, neuron] : *bank) {
                neuron.Serialize(out);
            }
        });
    if (!bank_written) {
        bank_cache_.Remove(partition);
        return false;
    }
    bank_cache_.Put(partition, bank);

    for (const auto& membership : memberships) {
        bool written = WriteAtomically(MembershipPath(membership.summary.id, partition),
                                       kMembershipMagic, kSnapshotVersion,
            [&membership](std::ostream& out) {
                membership.summary.Serialize(out);
                io::WritePod<uint64_t>(out, membership.neuron_ids.size());
                for (const auto& id : membership.neuron_ids) {
                    id.Serialize(out);
                }
            });
        if (!written) {
            return false;
        }
    }

    if (config_.verbose) {
        std::cerr << "BrainStorage: wrote " << clusters.size() << " clusters to "
                  << partition << std::endl;
    }
    return true;
}

std::vector<ClusterID> BrainStorage::SaveClusters(const std::vector<const NeuronCluster*>& clusters) {
    std::map<std::string, std::vector<const NeuronCluster*>> by_partition;
    for (const NeuronCluster* cluster : clusters) {
        if (cluster && cluster->IsLoaded()) {
            by_partition[cluster->GetPartition()].push_back(cluster);
        }
    }

    std::vector<std::pair<std::string, std::vector<const NeuronCluster*>>> jobs(
        by_partition.begin(), by_partition.end());

    std::vector<ClusterID> saved;
    for (size_t start = 0; start < jobs.size(); start += config_.max_concurrent_writes) {
        size_t end = std::min(jobs.size(), start + config_.max_concurrent_writes);

        std::vector<std::future<bool>> wave;
        wave.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            wave.push_back(std::async(std::launch::async, [this, &jobs, i] {
                return WritePartition(jobs[i].first, jobs[i].second);
            }));
        }

        for (size_t i = start; i < end; ++i) {
            bool ok = false;
            try {
                ok = wave[i - start].get();
            } catch (const std::exception& e) {
                std::cerr << "BrainStorage: partition " << jobs[i].first
                          << " failed: " << e.what() << std::endl;
            }
            if (!ok) {
                std::cerr << "BrainStorage: failed to save partition " << jobs[i].first << std::endl;
                continue;
            }
            for (const NeuronCluster* cluster : jobs[i].second) {
                saved.push_back(cluster->GetID());
            }
        }
    }
    return saved;
}

LoadResult<ClusterMembership> BrainStorage::LoadMembership(ClusterID id,
                                                           const std::string& partition) const {
    return ReadSnapshot<ClusterMembership>(MembershipPath(id, partition), kMembershipMagic,
                                           kSnapshotVersion, ReadMembership);
}

LoadResult<std::vector<Neuron>> BrainStorage::LoadCluster(ClusterID id, const std::string& partition) {
    auto membership = LoadMembership(id, partition);
    if (!membership.IsLoaded()) {
        return membership.IsCorrupt()
            ? LoadResult<std::vector<Neuron>>::Corrupt(membership.error)
            : LoadResult<std::vector<Neuron>>::Absent();
    }
    if (membership.value->summary.id != id) {
        return LoadResult<std::vector<Neuron>>::Corrupt("membership file of " + id.ToString() +
                                                        " names " + membership.value->summary.id.ToString());
    }

    const auto& ids = membership.value->neuron_ids;
    if (ids.empty()) {
        return LoadResult<std::vector<Neuron>>::Loaded({});
    }

    auto bank = GetBank(partition);
    if (!bank.IsLoaded()) {
        return LoadResult<std::vector<Neuron>>::Corrupt("no neuron bank for " + partition);
    }

    std::vector<Neuron> neurons;
    neurons.reserve(ids.size());
    for (const auto& neuron_id : ids) {
        auto it = (*bank.value)->find(neuron_id);
        if (it == (*bank.value)->end()) {
            return LoadResult<std::vector<Neuron>>::Corrupt(
                neuron_id.ToString() + " missing from bank of " + partition);
        }
        neurons.push_back(it->second);
    }
    return LoadResult<std::vector<Neuron>>::Loaded(std::move(neurons));
}

// ============================================================================
// Snapshots
// ============================================================================

bool BrainStorage::SaveCodebook(const CodebookSnapshot& snapshot) {
    return WriteAtomically(root_ / "codebook.bin", kCodebookMagic, kSnapshotVersion,
        [&snapshot](std::ostream& out) { snapshot.Serialize(out); });
}

LoadResult<CodebookSnapshot> BrainStorage::LoadCodebook() const {
    return ReadSnapshot<CodebookSnapshot>(root_ / "codebook.bin", kCodebookMagic, kSnapshotVersion,
                                          CodebookSnapshot::Deserialize);
}

bool BrainStorage::SaveActivationStats(const ActivationStats& stats) {
    return WriteAtomically(root_ / "activation_stats.bin", kActivationStatsMagic, kSnapshotVersion,
        [&stats](std::ostream& out) { stats.Serialize(out); });
}

LoadResult<ActivationStats> BrainStorage::LoadActivationStats(const ActivationStats::Config& config) const {
    return ReadSnapshot<ActivationStats>(root_ / "activation_stats.bin", kActivationStatsMagic,
                                         kSnapshotVersion,
        [&config](std::istream& in) { return ActivationStats::Deserialize(in, config); });
}

// ============================================================================
// Statistics
// ============================================================================

std::vector<BrainStorage::PartitionStats> BrainStorage::GetPartitionStats() const {
    std::vector<PartitionStats> result;
    std::error_code ec;
    std::filesystem::path partitions = root_ / "partitions";

    for (const auto& domain : std::filesystem::directory_iterator(partitions, ec)) {
        if (!domain.is_directory()) {
            continue;
        }
        std::error_code shard_ec;
        for (const auto& shard : std::filesystem::directory_iterator(domain.path(), shard_ec)) {
            if (!shard.is_directory()) {
                continue;
            }
            PartitionStats stats;
            stats.partition = domain.path().filename().string() + "/" + shard.path().filename().string();

            std::error_code file_ec;
            for (const auto& file : std::filesystem::directory_iterator(shard.path(), file_ec)) {
                if (!file.is_regular_file()) {
                    continue;
                }
                std::error_code size_ec;
                uint64_t bytes = file.file_size(size_ec);
                if (!size_ec) {
                    stats.total_bytes += bytes;
                }
                std::string name = file.path().filename().string();
                if (name.rfind("cluster_", 0) == 0) {
                    stats.cluster_files++;
                }
            }

            auto bank = GetBank(stats.partition);
            if (bank.IsLoaded()) {
                stats.bank_neurons = (*bank.value)->size();
            }
            result.push_back(stats);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const PartitionStats& a, const PartitionStats& b) { return a.partition < b.partition; });
    return result;
}

BrainStorage::StorageStats BrainStorage::GetStorageStats() const {
    StorageStats stats;
    stats.cluster_count = metadata_->CountClusters();
    stats.metadata_bytes = metadata_->GetDatabaseSize();

    std::error_code ec;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root_, ec)) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec)) {
            uint64_t bytes = entry.file_size(entry_ec);
            if (!entry_ec) {
                stats.total_bytes += bytes;
            }
            if (entry.path().filename() == "bank.bin") {
                stats.partition_count++;
            }
        }
    }
    stats.bank_cache = bank_cache_.GetStats();
    return stats;
}

} // namespace engram
