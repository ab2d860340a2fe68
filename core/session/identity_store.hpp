#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace tether {
namespace session {

constexpr const char *kClientIdKey = "tether.client_id";
constexpr const char *kLastConnectedAtKey = "tether.last_connected_at";

// Small string key-value store for the state that outlives the process
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string &key) const = 0;

    // Returns false if the value could not be stored
    virtual bool set(const std::string &key, const std::string &value) = 0;
};

class MemoryKeyValueStore : public IKeyValueStore {
public:
    std::optional<std::string> get(const std::string &key) const override;
    bool set(const std::string &key, const std::string &value) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Flat YAML map persisted to one file. Every set() rewrites the file via a
// temporary file and rename, so a crash never leaves it half written.
class YamlKeyValueStore : public IKeyValueStore {
public:
    // Loads the file if it exists; a missing or unreadable file starts empty
    explicit YamlKeyValueStore(std::string path);

    std::optional<std::string> get(const std::string &key) const override;
    bool set(const std::string &key, const std::string &value) override;

    const std::string &path() const { return path_; }

private:
    bool load(std::string &error);
    bool save(std::string &error) const;

    const std::string path_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Returns the client identifier, in order of preference: explicit (when
// non-empty), the stored value, or a freshly generated UUID. A generated or
// explicit id is written back to the store.
std::string resolve_client_id(IKeyValueStore &store, const std::optional<std::string> &explicit_id);

// Seconds since the epoch, as stored under kLastConnectedAtKey
std::optional<int64_t> load_last_connected_at(const IKeyValueStore &store);
bool store_last_connected_at(IKeyValueStore &store, int64_t epoch_seconds);

}  // namespace session
}  // namespace tether
