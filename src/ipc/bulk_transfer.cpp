#include "ipc/bulk_transfer.hpp"
#include "core/errors.hpp"
#include "core/serializer.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace plughost::ipc {

using json = nlohmann::json;

namespace {

constexpr size_t PRUNE_THRESHOLD = 256;
constexpr const char* FILE_PREFIX = "plughost-bulk-";
constexpr const char* FILE_SUFFIX = ".json";

bool has_affixes(const std::string& name) {
    std::string prefix = FILE_PREFIX;
    std::string suffix = FILE_SUFFIX;
    return name.size() > prefix.size() + suffix.size() &&
           name.compare(0, prefix.size(), prefix) == 0 &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string default_directory() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) {
        return tmpdir;
    }
    return "/tmp";
}

// Canonical form without a trailing separator, or empty if it cannot be resolved
std::string normalized_directory(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return {};
    }
    if (!canonical.has_filename() && canonical.has_parent_path()) {
        canonical = canonical.parent_path();
    }
    return canonical.string();
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // anonymous namespace

BulkTransfer::BulkTransfer(BulkTransferOptions options)
    : options_(std::move(options)) {
    directory_ = options_.temp_dir.empty() ? default_directory() : options_.temp_dir;
    canonical_directory_ = normalized_directory(directory_);
}

BulkTransfer::~BulkTransfer() {
    cleanup();
}

bool BulkTransfer::is_reference(const json& value) {
    if (!value.is_object()) {
        return false;
    }
    auto tag = value.find(core::TYPE_KEY);
    return tag != value.end() && tag->is_string() &&
           tag->get<std::string>() == core::BULK_TYPE;
}

std::string BulkTransfer::next_path() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    char suffix[9];
    snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(rng()));
    return directory_ + "/" + FILE_PREFIX + std::to_string(getpid()) + "-" +
           std::to_string(++sequence_) + "-" + suffix + FILE_SUFFIX;
}

json BulkTransfer::wrap(const json& serialized) {
    std::string payload = serialized.dump(-1, ' ', false, json::error_handler_t::replace);
    if (payload.size() <= options_.threshold) {
        return serialized;
    }

    std::string path = next_path();
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TransportError("Failed to create bulk transfer file " + path + ": " + strerror(errno));
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.close();
        if (!out) {
            unlink(path.c_str());
            throw TransportError("Failed to write bulk transfer file " + path);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        written_.insert(path);
        if (written_.size() > PRUNE_THRESHOLD) {
            prune_consumed_locked();
        }
    }

    spdlog::debug("Bulk transfer: {} bytes via {}", payload.size(), path);
    return json{{core::TYPE_KEY, core::BULK_TYPE}, {"path", path}, {"size", payload.size()}};
}

std::string BulkTransfer::checked_path(const json& reference) const {
    auto path_it = reference.find("path");
    if (path_it == reference.end() || !path_it->is_string()) {
        throw DeserializationError("Bulk transfer reference without a path");
    }
    std::string path = path_it->get<std::string>();

    namespace fs = std::filesystem;
    fs::path requested(path);
    if (!has_affixes(requested.filename().string())) {
        throw DeserializationError("Bulk transfer path " + path + " is not a bulk transfer file");
    }
    std::string parent = normalized_directory(requested.parent_path());
    if (parent.empty() || parent != canonical_directory_) {
        throw DeserializationError("Bulk transfer path " + path + " is outside " + directory_);
    }
    std::error_code ec;
    auto status = fs::symlink_status(requested, ec);
    if (ec || !fs::is_regular_file(status)) {
        throw DeserializationError("Bulk transfer file " + path + " cannot be opened");
    }
    return path;
}

json BulkTransfer::unwrap(const json& value) {
    if (!is_reference(value)) {
        return value;
    }
    std::string path = checked_path(value);

    std::string payload;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw DeserializationError("Bulk transfer file " + path + " cannot be opened");
        }
        payload.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    if (auto size = value.find("size"); size != value.end() && size->is_number_unsigned() &&
                                        size->get<size_t>() != payload.size()) {
        throw DeserializationError("Bulk transfer file " + path + " is truncated");
    }

    json result = core::parse_wire(payload);

    if (unlink(path.c_str()) < 0) {
        spdlog::warn("Failed to remove bulk transfer file {}: {}", path, strerror(errno));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        written_.erase(path);
    }
    return result;
}

void BulkTransfer::discard(const json& reference) {
    if (!is_reference(reference)) {
        return;
    }
    auto path_it = reference.find("path");
    if (path_it == reference.end() || !path_it->is_string()) {
        return;
    }
    std::string path = path_it->get<std::string>();

    std::lock_guard<std::mutex> lock(mutex_);
    if (written_.erase(path) > 0 && unlink(path.c_str()) < 0) {
        spdlog::debug("Failed to remove bulk transfer file {}: {}", path, strerror(errno));
    }
}

void BulkTransfer::prune_consumed_locked() {
    for (auto it = written_.begin(); it != written_.end();) {
        if (!file_exists(*it)) {
            it = written_.erase(it);
        } else {
            ++it;
        }
    }
}

void BulkTransfer::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& path : written_) {
        if (unlink(path.c_str()) == 0) {
            spdlog::debug("Removed unconsumed bulk transfer file {}", path);
        }
    }
    written_.clear();
}

} // namespace plughost::ipc
