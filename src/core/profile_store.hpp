#pragma once

#include "core/errors.hpp"

#include <optional>
#include <string>
#include <vector>

struct Profile {
    std::string name;          // "work"
    std::string config_file;   // absolute path to the .ovpn file
};

/// Named profiles persisted as profiles.yaml in a per-user directory.
/// Every call re-reads the file; writes go through a temp file and rename.
class ProfileStore {
public:
    explicit ProfileStore(std::string store_dir);

    const std::string& store_dir() const { return store_dir_; }

    /// Path of profiles.yaml
    std::string metadata_path() const;

    struct ListResult {
        OpResult status;
        std::vector<Profile> profiles;
    };
    /// Profiles in insertion order; a missing store is an empty list
    ListResult list_profiles() const;

    /// Add a profile. Rejects blank names, missing files and duplicate names.
    OpResult add_profile(const std::string& name, const std::string& config_file);

    /// Remove a profile; NotFound if there is no such name
    OpResult remove_profile(const std::string& name);

    struct GetResult {
        OpResult status;
        std::optional<Profile> profile;
    };
    /// Exact, case-sensitive lookup
    GetResult get_profile(const std::string& name) const;

private:
    std::string store_dir_;

    OpResult load(std::vector<Profile>& out) const;
    OpResult save(const std::vector<Profile>& profiles) const;
};
