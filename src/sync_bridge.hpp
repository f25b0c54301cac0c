#pragma once

#include <functional>
#include <optional>
#include <string>

#include "blob.hpp"
#include "blob_store.hpp"

// Keeps one surface's state and the shared blob in step. Every local mutation is written
// as a whole snapshot (last writer wins); a write from another surface replaces the local
// state wholesale. There is no merge.
class SyncBridge {
  public:
    SyncBridge(BlobStore &store, std::string key);

    const std::string &Key() const {
        return m_Key;
    }

    // Initial hydration. nullopt when the blob is missing or unreadable.
    std::optional<FocusSnapshot> Load();

    // Writes the snapshot. A persist requested while an external snapshot is being applied
    // is dropped: it would only echo the other surface's write back to it.
    bool Persist(const FocusSnapshot &snapshot);

    // If another surface wrote the key, decode its blob and hand it to `apply`. A malformed
    // blob is logged and skipped; the local state stays as it was. Returns true when a
    // snapshot was applied.
    bool PollExternal(const std::function<void(FocusSnapshot)> &apply);

    bool Hydrating() const {
        return m_Hydrating;
    }

  private:
    BlobStore &m_Store;
    std::string m_Key;
    BlobCodec m_Codec;
    bool m_Hydrating = false;
};
