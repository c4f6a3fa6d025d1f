// Model snapshot persistence.
//
// The 26x26 covariance and its inverse dominate the snapshot (2 x 5.4 KB of
// doubles); both are stored as zstd blocks. Everything else is raw
// little-endian scalars.

#include "capbox/model_store.hpp"
#include "capbox/errors.hpp"
#include "capbox/log_utils.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <zstd.h>

namespace capbox {

namespace {

constexpr uint32_t FLAG_IMPORTANCE = 1u << 0;
constexpr uint32_t FLAG_COVARIANCE = 1u << 1;
constexpr uint32_t FLAG_DEGRADED = 1u << 2;

class ByteWriter {
public:
    template <typename T>
    void put(const T& value) {
        const char* p = reinterpret_cast<const char*>(&value);
        buf_.append(p, sizeof(T));
    }

    void put_bytes(const char* data, size_t len) { buf_.append(data, len); }

    std::string take() { return std::move(buf_); }

private:
    std::string buf_;
};

class ByteReader {
public:
    explicit ByteReader(const std::string& bytes) : data_(bytes.data()), size_(bytes.size()) {}

    template <typename T>
    T get() {
        T value;
        std::memcpy(&value, take(sizeof(T)), sizeof(T));
        return value;
    }

    const char* take(size_t len) {
        if (len > size_ - pos_) {
            throw PersistenceError("model snapshot truncated at byte " + std::to_string(pos_));
        }
        const char* p = data_ + pos_;
        pos_ += len;
        return p;
    }

    bool at_end() const { return pos_ == size_; }

private:
    const char* data_;
    size_t size_;
    size_t pos_ = 0;
};

void write_matrix_block(ByteWriter& w, const FlatMatrix& m) {
    if (m.size() != NUM_MATRIX_ENTRIES) {
        throw DimensionMismatch("model matrix has " + std::to_string(m.size()) + " entries, expected " +
                                std::to_string(NUM_MATRIX_ENTRIES));
    }
    const size_t raw_size = m.size() * sizeof(double);
    std::string compressed(ZSTD_compressBound(raw_size), '\0');
    const size_t got = ZSTD_compress(compressed.data(), compressed.size(),
                                     m.data(), raw_size, ZSTD_COMPRESSION_LEVEL);
    if (ZSTD_isError(got)) {
        throw PersistenceError(std::string("ZSTD compression failed: ") + ZSTD_getErrorName(got));
    }
    w.put(static_cast<uint32_t>(got));
    w.put(static_cast<uint32_t>(raw_size));
    w.put_bytes(compressed.data(), got);
}

FlatMatrix read_matrix_block(ByteReader& r) {
    const uint32_t compressed_size = r.get<uint32_t>();
    const uint32_t raw_size = r.get<uint32_t>();
    if (raw_size != NUM_MATRIX_ENTRIES * sizeof(double)) {
        throw PersistenceError("model matrix block has unexpected size " + std::to_string(raw_size));
    }
    const char* src = r.take(compressed_size);

    FlatMatrix m(NUM_MATRIX_ENTRIES);
    const size_t got = ZSTD_decompress(m.data(), raw_size, src, compressed_size);
    if (ZSTD_isError(got) || got != raw_size) {
        throw PersistenceError("model matrix ZSTD decompression failed");
    }
    return m;
}

void write_params(ByteWriter& w, const std::vector<GaussianParams>& params) {
    if (params.size() != NUM_FEATURES) {
        throw DimensionMismatch("model carries " + std::to_string(params.size()) +
                                " Gaussian parameters, expected " + std::to_string(NUM_FEATURES));
    }
    for (const auto& p : params) {
        w.put(p.mean);
        w.put(p.std);
    }
}

std::vector<GaussianParams> read_params(ByteReader& r) {
    std::vector<GaussianParams> params(NUM_FEATURES);
    for (auto& p : params) {
        p.mean = r.get<double>();
        p.std = r.get<double>();
    }
    return params;
}

}  // namespace

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string serialize_model(const Model& model) {
    if (model.covariance_matrix.has_value() != model.covariance_inverse.has_value()) {
        throw PersistenceError("model has covariance matrix without inverse (or vice versa)");
    }

    uint32_t flags = 0;
    if (model.feature_importance) flags |= FLAG_IMPORTANCE;
    if (model.has_covariance()) flags |= FLAG_COVARIANCE;
    if (model.inverse_degraded) flags |= FLAG_DEGRADED;

    ByteWriter w;
    w.put(MODEL_FILE_MAGIC);
    w.put(MODEL_FILE_VERSION);
    w.put(flags);
    w.put(static_cast<uint64_t>(model.revision));
    w.put(static_cast<int64_t>(model.trained_at));
    w.put(static_cast<uint64_t>(model.n_training_samples));
    w.put(model.prior_in);
    w.put(model.prior_out);
    w.put(static_cast<uint32_t>(model.version.size()));
    w.put_bytes(model.version.data(), model.version.size());

    write_params(w, model.in_features);
    write_params(w, model.out_features);

    if (model.feature_importance) {
        if (model.feature_importance->size() != NUM_FEATURES) {
            throw DimensionMismatch("feature importance has " +
                                    std::to_string(model.feature_importance->size()) + " entries");
        }
        for (const auto& f : *model.feature_importance) {
            w.put(f.fisher_score);
            w.put(f.mean_difference);
            w.put(f.importance_weight);
        }
    }

    if (model.has_covariance()) {
        write_matrix_block(w, *model.covariance_matrix);
        write_matrix_block(w, *model.covariance_inverse);
    }

    return w.take();
}

std::shared_ptr<const Model> deserialize_model(const std::string& bytes) {
    ByteReader r(bytes);

    if (r.get<uint64_t>() != MODEL_FILE_MAGIC) {
        throw PersistenceError("not a capbox model snapshot (bad magic)");
    }
    const uint32_t format = r.get<uint32_t>();
    if (format != MODEL_FILE_VERSION) {
        throw PersistenceError("unsupported model snapshot version " + std::to_string(format));
    }
    const uint32_t flags = r.get<uint32_t>();

    auto model = std::make_shared<Model>();
    model->revision = r.get<uint64_t>();
    model->trained_at = r.get<int64_t>();
    model->n_training_samples = static_cast<size_t>(r.get<uint64_t>());
    model->prior_in = r.get<double>();
    model->prior_out = r.get<double>();

    const uint32_t version_len = r.get<uint32_t>();
    const char* version = r.take(version_len);
    model->version.assign(version, version_len);

    model->in_features = read_params(r);
    model->out_features = read_params(r);

    if (flags & FLAG_IMPORTANCE) {
        std::vector<FisherScore> importance(NUM_FEATURES);
        for (size_t i = 0; i < NUM_FEATURES; ++i) {
            importance[i].feature_index = i;
            importance[i].feature_name = FEATURE_NAMES[i];
            importance[i].fisher_score = r.get<double>();
            importance[i].mean_difference = r.get<double>();
            importance[i].importance_weight = r.get<double>();
        }
        model->feature_importance = std::move(importance);
    }

    if (flags & FLAG_COVARIANCE) {
        model->covariance_matrix = read_matrix_block(r);
        model->covariance_inverse = read_matrix_block(r);
    }
    model->inverse_degraded = (flags & FLAG_DEGRADED) != 0;

    if (!r.at_end()) {
        throw PersistenceError("trailing bytes after model snapshot");
    }
    return model;
}

// ---------------------------------------------------------------------------
// InMemoryModelStore
// ---------------------------------------------------------------------------

InMemoryModelStore::InMemoryModelStore(std::shared_ptr<const Model> initial)
    : current_(std::move(initial)) {}

std::shared_ptr<const Model> InMemoryModelStore::load_current_model() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void InMemoryModelStore::save_model(std::shared_ptr<const Model> model) {
    if (!model) {
        throw PersistenceError("refusing to save a null model");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(model);
    ++saves_;
}

void InMemoryModelStore::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
}

size_t InMemoryModelStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
}

// ---------------------------------------------------------------------------
// FileModelStore
// ---------------------------------------------------------------------------

FileModelStore::FileModelStore(const std::string& path) : path_(path) {}

std::shared_ptr<const Model> FileModelStore::load_current_model() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            return nullptr;
        }
        throw PersistenceError("cannot open model snapshot: " + path_);
    }

    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw PersistenceError("read failed: " + path_);
    }
    try {
        return deserialize_model(bytes);
    } catch (const PersistenceError&) {
        log_utils::warn("Unreadable model snapshot: " + path_);
        throw;
    }
}

void FileModelStore::save_model(std::shared_ptr<const Model> model) {
    if (!model) {
        throw PersistenceError("refusing to save a null model");
    }
    const std::string bytes = serialize_model(*model);
    const std::string tmp_path = path_ + ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceError("cannot open for writing: " + tmp_path);
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw PersistenceError("write failed: " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp_path, cleanup_ec);
        throw PersistenceError("cannot replace " + path_ + ": " + ec.message());
    }
    log_utils::debug("Saved model " + model->version + " to " + path_ +
                     " (" + std::to_string(bytes.size()) + " bytes)");
}

void FileModelStore::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        throw PersistenceError("cannot remove " + path_ + ": " + ec.message());
    }
}

}  // namespace capbox
