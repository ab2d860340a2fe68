#include "identity_store.hpp"

#include <yaml-cpp/yaml.h>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <filesystem>
#include <fstream>

#include "logging/logger.hpp"

namespace tether {
namespace session {

std::optional<std::string> MemoryKeyValueStore::get(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::set(const std::string &key, const std::string &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return true;
}

YamlKeyValueStore::YamlKeyValueStore(std::string path) : path_(std::move(path)) {
    std::string error;
    if (!load(error)) {
        LOG_WARN("[Identity] " << error << " (starting with an empty store)");
    }
}

std::optional<std::string> YamlKeyValueStore::get(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool YamlKeyValueStore::set(const std::string &key, const std::string &value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto previous = values_.find(key);
    std::optional<std::string> old_value;
    if (previous != values_.end()) {
        old_value = previous->second;
    }
    values_[key] = value;

    std::string error;
    if (!save(error)) {
        if (old_value) {
            values_[key] = *old_value;
        } else {
            values_.erase(key);
        }
        LOG_WARN("[Identity] Failed to persist '" << key << "': " << error);
        return false;
    }
    return true;
}

bool YamlKeyValueStore::load(std::string &error) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return true;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_);
        if (!root || root.IsNull()) {
            return true;
        }
        if (!root.IsMap()) {
            error = "Identity store " + path_ + " is not a YAML map";
            return false;
        }
        for (const auto &entry : root) {
            values_[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open identity store: " + path_;
        return false;
    } catch (const YAML::Exception &e) {
        error = "Identity store parse error: " + std::string(e.what());
        return false;
    }
}

bool YamlKeyValueStore::save(std::string &error) const {
    std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto &[key, value] : values_) {
        out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
    }
    out << YAML::EndMap;
    if (!out.good()) {
        error = "YAML emit error: " + out.GetLastError();
        return false;
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            error = "Cannot write " + tmp_path;
            return false;
        }
        file << out.c_str() << "\n";
        file.flush();
        if (!file) {
            error = "Short write to " + tmp_path;
            return false;
        }
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        error = "Cannot replace " + path_;
        return false;
    }
    return true;
}

std::string resolve_client_id(IKeyValueStore &store, const std::optional<std::string> &explicit_id) {
    if (explicit_id && !explicit_id->empty()) {
        if (store.get(kClientIdKey) != *explicit_id && !store.set(kClientIdKey, *explicit_id)) {
            LOG_WARN("[Identity] Client id " << *explicit_id << " could not be persisted");
        }
        return *explicit_id;
    }

    if (auto stored = store.get(kClientIdKey)) {
        if (!stored->empty()) {
            return *stored;
        }
    }

    boost::uuids::random_generator generator;
    std::string generated = boost::uuids::to_string(generator());
    if (!store.set(kClientIdKey, generated)) {
        LOG_WARN("[Identity] Generated client id " << generated << " could not be persisted");
    } else {
        LOG_INFO("[Identity] Generated client id " << generated);
    }
    return generated;
}

std::optional<int64_t> load_last_connected_at(const IKeyValueStore &store) {
    auto stored = store.get(kLastConnectedAtKey);
    if (!stored || stored->empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int64_t value = std::stoll(*stored, &consumed);
        if (consumed != stored->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception &e) {
        LOG_WARN("[Identity] Ignoring malformed " << kLastConnectedAtKey << " '" << *stored << "'");
        return std::nullopt;
    }
}

bool store_last_connected_at(IKeyValueStore &store, int64_t epoch_seconds) {
    return store.set(kLastConnectedAtKey, std::to_string(epoch_seconds));
}

}  // namespace session
}  // namespace tether
