#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace plughost::ipc {

constexpr size_t DEFAULT_BULK_THRESHOLD = 1000000;

struct BulkTransferOptions {
    // Serialized size above which a value leaves the envelope
    size_t threshold = DEFAULT_BULK_THRESHOLD;
    // Empty: $TMPDIR, falling back to /tmp
    std::string temp_dir;
};

// Side channel for large values: the value is written to a temp file and the
// envelope carries {"__type":"BulkTransfer","path","size"} instead. The
// reader deletes the file after loading it.
class BulkTransfer {
public:
    explicit BulkTransfer(BulkTransferOptions options = {});
    ~BulkTransfer();

    BulkTransfer(const BulkTransfer&) = delete;
    BulkTransfer& operator=(const BulkTransfer&) = delete;

    // Returns the serialized value unchanged when it fits inline, otherwise a
    // reference. Throws TransportError if the temp file cannot be written.
    nlohmann::json wrap(const nlohmann::json& serialized);

    // Loads and deletes the file behind a reference; other values are
    // returned unchanged. Only plughost-bulk-* files directly inside the
    // bulk directory are accepted. The file is deleted once it has been
    // read and parsed. Throws DeserializationError otherwise.
    nlohmann::json unwrap(const nlohmann::json& value);

    // Delete the file behind a reference this instance wrote but never sent
    void discard(const nlohmann::json& reference);

    static bool is_reference(const nlohmann::json& value);

    // Remove files written by this instance that nobody consumed
    void cleanup();

    size_t threshold() const { return options_.threshold; }
    const std::string& directory() const { return directory_; }

private:
    std::string next_path();
    std::string checked_path(const nlohmann::json& reference) const;
    void prune_consumed_locked();

    BulkTransferOptions options_;
    std::string directory_;
    std::string canonical_directory_;
    std::atomic<uint64_t> sequence_{0};
    std::mutex mutex_;
    std::set<std::string> written_;
};

} // namespace plughost::ipc
