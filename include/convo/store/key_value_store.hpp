#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace convo::store {

/**
 * @brief Small persistent key-value store backed by one JSON document.
 *
 * Values are grouped by namespace:
 * `{ "<namespace>": { "<key>": <json value>, ... }, ... }`.
 * A store constructed with an empty path lives in memory only.
 */
class KeyValueStore {
public:
  KeyValueStore() = default;
  explicit KeyValueStore(std::filesystem::path path);

  const std::filesystem::path &path() const noexcept { return path_; }
  bool persistent() const noexcept { return !path_.empty(); }

  std::optional<nlohmann::json> get(const std::string &ns,
                                    const std::string &key) const;
  bool set(const std::string &ns, const std::string &key, nlohmann::json value);
  bool erase(const std::string &ns, const std::string &key);
  bool contains(const std::string &ns, const std::string &key) const;

  // Re-reads the document from disk. A missing or malformed file loads empty.
  void reload();

  static std::filesystem::path defaultPath(const std::string &appId);

private:
  bool save() const;

  std::filesystem::path path_;
  nlohmann::json document_ = nlohmann::json::object();
};

} // namespace convo::store
