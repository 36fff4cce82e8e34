#include "convo/store/key_value_store.hpp"
#include "convo/log.hpp"
#include "convo/options.hpp"

#include <fstream>
#include <system_error>

namespace convo::store {

KeyValueStore::KeyValueStore(std::filesystem::path path)
    : path_(std::move(path)) {
  reload();
}

std::optional<nlohmann::json> KeyValueStore::get(const std::string &ns,
                                                 const std::string &key) const {
  auto nsIt = document_.find(ns);
  if (nsIt == document_.end() || !nsIt->is_object())
    return std::nullopt;
  auto keyIt = nsIt->find(key);
  if (keyIt == nsIt->end())
    return std::nullopt;
  return *keyIt;
}

bool KeyValueStore::set(const std::string &ns, const std::string &key,
                        nlohmann::json value) {
  auto &bucket = document_[ns];
  if (!bucket.is_object())
    bucket = nlohmann::json::object();
  bucket[key] = std::move(value);
  return save();
}

bool KeyValueStore::erase(const std::string &ns, const std::string &key) {
  auto nsIt = document_.find(ns);
  if (nsIt == document_.end() || !nsIt->is_object())
    return false;
  if (nsIt->erase(key) == 0)
    return false;
  return save();
}

bool KeyValueStore::contains(const std::string &ns,
                             const std::string &key) const {
  return get(ns, key).has_value();
}

void KeyValueStore::reload() {
  document_ = nlohmann::json::object();
  if (path_.empty())
    return;

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec))
    return;

  std::ifstream file(path_);
  if (!file.is_open())
    return;
  try {
    nlohmann::json doc;
    file >> doc;
    if (doc.is_object())
      document_ = std::move(doc);
    else
      log::warning("Ignoring " + path_.string() + ": top level is not an object");
  } catch (const nlohmann::json::exception &ex) {
    log::warning("Ignoring malformed " + path_.string() + ": " + ex.what());
    document_ = nlohmann::json::object();
  }
}

// Lives beside the option defaults of the same app.
std::filesystem::path KeyValueStore::defaultPath(const std::string &appId) {
  return config::OptionRegistry::configRoot() / appId / "store.json";
}

bool KeyValueStore::save() const {
  if (path_.empty())
    return true;

  std::error_code ec;
  if (path_.has_parent_path())
    std::filesystem::create_directories(path_.parent_path(), ec);

  std::ofstream file(path_, std::ios::trunc);
  if (!file.is_open()) {
    log::error("Unable to write " + path_.string());
    return false;
  }
  file << document_.dump(2) << '\n';
  return static_cast<bool>(file);
}

} // namespace convo::store
