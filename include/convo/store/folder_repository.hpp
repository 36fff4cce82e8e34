#pragma once

#include "convo/store/entities.hpp"

#include <vector>

namespace convo::store {

class KeyValueStore;

inline constexpr char kFolderNamespace[] = "sidebar";
inline constexpr char kFolderKey[] = "folders";

// Reads and writes the folder collection under a fixed key-value namespace.
class FolderRepository {
public:
  explicit FolderRepository(KeyValueStore &store);

  std::vector<Folder> load() const;
  bool save(const std::vector<Folder> &folders);

private:
  KeyValueStore &store_;
};

} // namespace convo::store
