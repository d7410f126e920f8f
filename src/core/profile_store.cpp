#include "core/profile_store.hpp"
#include "core/validation.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

ProfileStore::ProfileStore(std::string store_dir) : store_dir_(std::move(store_dir)) {}

std::string ProfileStore::metadata_path() const {
    if (store_dir_.empty()) return "";
    return store_dir_ + "/profiles.yaml";
}

OpResult ProfileStore::load(std::vector<Profile>& out) const {
    out.clear();
    std::string path = metadata_path();
    if (path.empty()) {
        return OpResult::fail(FailureKind::StorageError, "Cannot determine profile store directory");
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return OpResult::fail(FailureKind::StorageError,
                                  "Cannot access " + path + ": " + ec.message());
        }
        return OpResult::ok();
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        if (root.IsNull()) return OpResult::ok();
        if (!root.IsSequence()) {
            return OpResult::fail(FailureKind::StorageError,
                                  "Malformed profile store " + path + ": expected a list");
        }

        for (const auto& node : root) {
            Profile p;
            p.name = node["name"].as<std::string>("");
            p.config_file = node["config_file"].as<std::string>("");
            if (p.name.empty()) continue;
            out.push_back(std::move(p));
        }
    } catch (const YAML::Exception& e) {
        out.clear();
        return OpResult::fail(FailureKind::StorageError,
                              "Cannot read profile store " + path + ": " + e.what());
    }
    return OpResult::ok();
}

OpResult ProfileStore::save(const std::vector<Profile>& profiles) const {
    std::string path = metadata_path();
    if (path.empty()) {
        return OpResult::fail(FailureKind::StorageError, "Cannot determine profile store directory");
    }

    std::error_code ec;
    fs::create_directories(store_dir_, ec);
    if (ec) {
        return OpResult::fail(FailureKind::StorageError,
                              "Cannot create " + store_dir_ + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& p : profiles) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << p.name;
        out << YAML::Key << "config_file" << YAML::Value << p.config_file;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    // Atomic write: write to temp file, then rename
    std::string tmp = path + ".tmp";
    std::ofstream fout(tmp, std::ios::trunc);
    if (!fout.is_open()) {
        return OpResult::fail(FailureKind::StorageError, "Cannot write " + tmp);
    }
    fout << out.c_str() << "\n";
    fout.close();
    if (fout.fail()) {
        fs::remove(tmp, ec);
        return OpResult::fail(FailureKind::StorageError, "Failed writing " + tmp);
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return OpResult::fail(FailureKind::StorageError,
                              "Cannot replace " + path + ": " + ec.message());
    }
    return OpResult::ok();
}

ProfileStore::ListResult ProfileStore::list_profiles() const {
    ListResult result;
    result.status = load(result.profiles);
    return result;
}

OpResult ProfileStore::add_profile(const std::string& name, const std::string& config_file) {
    if (is_blank(name)) {
        return OpResult::fail(FailureKind::InvalidInput, "Profile name is required");
    }
    if (!config_file_exists(config_file)) {
        return OpResult::fail(FailureKind::InvalidInput, "Config file not found: " + config_file);
    }

    std::vector<Profile> profiles;
    auto loaded = load(profiles);
    if (!loaded.success) return loaded;

    auto it = std::find_if(profiles.begin(), profiles.end(),
        [&](const Profile& p) { return p.name == name; });
    if (it != profiles.end()) {
        return OpResult::fail(FailureKind::DuplicateName, "Profile already exists: " + name);
    }

    // Store absolute paths so later commands work from any directory
    std::error_code ec;
    fs::path abs = fs::absolute(config_file, ec);
    Profile p;
    p.name = name;
    p.config_file = ec ? config_file : abs.lexically_normal().string();
    profiles.push_back(std::move(p));

    return save(profiles);
}

OpResult ProfileStore::remove_profile(const std::string& name) {
    std::vector<Profile> profiles;
    auto loaded = load(profiles);
    if (!loaded.success) return loaded;

    auto it = std::find_if(profiles.begin(), profiles.end(),
        [&](const Profile& p) { return p.name == name; });
    if (it == profiles.end()) {
        return OpResult::fail(FailureKind::NotFound, "Profile not found: " + name);
    }

    profiles.erase(it);
    return save(profiles);
}

ProfileStore::GetResult ProfileStore::get_profile(const std::string& name) const {
    GetResult result;
    std::vector<Profile> profiles;
    result.status = load(profiles);
    if (!result.status.success) return result;

    auto it = std::find_if(profiles.begin(), profiles.end(),
        [&](const Profile& p) { return p.name == name; });
    if (it != profiles.end()) {
        result.profile = *it;
    }
    return result;
}
