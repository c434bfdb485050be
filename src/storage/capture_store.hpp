#pragma once

#include "authorization_source.hpp"
#include "connection_pool.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace snapgate::storage {

struct NewCapture {
    std::string uid;
    std::string room;
    std::string name;
    std::span<const uint8_t> image;
    std::string image_hash;
    std::string timestamp;
};

enum class RecordStatus : uint8_t {
    stored,
    duplicate,
};

struct RecordOutcome {
    RecordStatus status = RecordStatus::stored;
    int64_t row_id = 0;
};

struct StoredCapture {
    int64_t id = 0;
    std::string uid;
    std::string room;
    std::string name;
    std::vector<uint8_t> image;
    std::string image_hash;
    int64_t image_size = 0;
    std::string timestamp;
};

// Durable, deduplicating storage for accepted images plus read access to the
// authorization table.
class CaptureStore : public AuthorizationSource {
public:
    [[nodiscard]] static auto create(PoolOptions options) -> ResultPtr<CaptureStore>;

    ~CaptureStore() override = default;

    CaptureStore(const CaptureStore&) = delete;
    CaptureStore& operator=(const CaptureStore&) = delete;

    [[nodiscard]] auto lookup_authorization(const std::string& uid, const std::string& room)
        -> Result<std::optional<std::string>> override;

    // Stores the capture unless a row with the same (image_hash, uid, room)
    // already exists, in which case the existing row id is reported as a
    // duplicate.
    [[nodiscard]] auto record_capture(const NewCapture& capture) -> Result<RecordOutcome>;

    // Out-of-band allow-list maintenance; the ingestion path never calls this.
    [[nodiscard]] auto grant_authorization(const std::string& uid, const std::string& room,
                                           const std::string& name) -> Result<void>;

    [[nodiscard]] auto capture_count() -> Result<int64_t>;
    [[nodiscard]] auto load_capture(int64_t id) -> Result<std::optional<StoredCapture>>;

    void drain_pool() { m_pool.drain(); }
    [[nodiscard]] auto pool() -> ConnectionPool& { return m_pool; }

private:
    explicit CaptureStore(PoolOptions options) : m_pool(std::move(options)) {}

    ConnectionPool m_pool;
    std::mutex m_write_mutex;
};

} // namespace snapgate::storage
