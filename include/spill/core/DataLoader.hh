#pragma once

#include "spill/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace spill {

// Parsed TOML document with dotted-key typed getters ("droplet.tweens.decay.duration").
// Every getter reports NotFound for a missing key and InvalidState for a type mismatch.
class DataLoader {
  public:
    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;
    Result<std::vector<std::string>> getStringArray(std::string_view key) const;
    // Accepts integers and floats mixed, e.g. [1, 2.5]
    Result<std::vector<double>> getFloatArray(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const toml::table& table() const;
    const std::string& sourceName() const;

  private:
    DataLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

// DataRegistry: thread-safe cache of parsed preset files keyed by absolute path.
class DataRegistry {
  public:
    // Get or load a preset. Caches the result.
    Result<const DataLoader*> get(const std::filesystem::path& path);

    // Re-parse from disk, replacing any cached copy.
    Result<const DataLoader*> reload(const std::filesystem::path& path);

    void remove(const std::filesystem::path& path);
    void clear();
    bool contains(const std::filesystem::path& path) const;
    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DataLoader> cache_;
};

} // namespace spill
