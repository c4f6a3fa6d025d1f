#pragma once
/**
 * @file model_store.hpp
 * @brief In-memory and file-backed ModelStore implementations
 *
 * Snapshot file format (.cbm, little-endian):
 *
 *   magic        u64   "CAPBOXM1"
 *   format       u32   MODEL_FILE_VERSION
 *   flags        u32   bit 0: importance, bit 1: covariance, bit 2: degraded inverse
 *   revision     u64
 *   trained_at   i64
 *   n_samples    u64
 *   prior_in     f64
 *   prior_out    f64
 *   version      u32 length + bytes
 *   in params    NUM_FEATURES x (f64 mean, f64 std)
 *   out params   NUM_FEATURES x (f64 mean, f64 std)
 *   [importance] NUM_FEATURES x (f64 score, f64 mean_diff, f64 weight)
 *   [covariance] block: u32 compressed size, u32 raw size, zstd payload
 *   [inverse]    block: same layout
 *
 * Writes go to "<path>.tmp" and are renamed over the target, so a reader
 * never opens a half-written snapshot.
 */

#include "capbox/collaborators.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace capbox {

constexpr uint64_t MODEL_FILE_MAGIC = 0x314D584F42504143ULL;  // "CAPBOXM1"
constexpr uint32_t MODEL_FILE_VERSION = 1;
constexpr int ZSTD_COMPRESSION_LEVEL = 3;

class InMemoryModelStore : public ModelStore {
public:
    InMemoryModelStore() = default;
    explicit InMemoryModelStore(std::shared_ptr<const Model> initial);

    std::shared_ptr<const Model> load_current_model() override;
    void save_model(std::shared_ptr<const Model> model) override;
    void reset() override;

    size_t save_count() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Model> current_;
    size_t saves_ = 0;
};

class FileModelStore : public ModelStore {
public:
    explicit FileModelStore(const std::string& path);

    std::shared_ptr<const Model> load_current_model() override;
    void save_model(std::shared_ptr<const Model> model) override;
    void reset() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

// Serialization used by FileModelStore; exposed for tests and tooling.
std::string serialize_model(const Model& model);
std::shared_ptr<const Model> deserialize_model(const std::string& bytes);

}  // namespace capbox
