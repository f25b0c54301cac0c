#include "sync_bridge.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SyncBridge::SyncBridge(BlobStore &store, std::string key) : m_Store(store), m_Key(std::move(key)) {
}

// ─────────────────────────────────────
std::optional<FocusSnapshot> SyncBridge::Load() {
    const auto text = m_Store.Read(m_Key);
    if (!text) {
        spdlog::info("SyncBridge: no blob under '{}', starting from defaults", m_Key);
        return std::nullopt;
    }
    auto snapshot = m_Codec.Decode(*text);
    if (!snapshot) {
        spdlog::warn("SyncBridge: blob under '{}' is unreadable, starting from defaults", m_Key);
    }
    return snapshot;
}

// ─────────────────────────────────────
bool SyncBridge::Persist(const FocusSnapshot &snapshot) {
    if (m_Hydrating) {
        spdlog::debug("SyncBridge: persist during hydration ignored");
        return true;
    }

    std::string error;
    if (!m_Store.Write(m_Key, m_Codec.Encode(snapshot), error)) {
        spdlog::error("SyncBridge: failed to persist '{}': {}", m_Key, error);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SyncBridge::PollExternal(const std::function<void(FocusSnapshot)> &apply) {
    if (m_Hydrating) {
        return false;
    }

    const auto changed = m_Store.PollChangedKeys();
    if (std::find(changed.begin(), changed.end(), m_Key) == changed.end()) {
        return false;
    }

    const auto text = m_Store.Read(m_Key);
    if (!text) {
        spdlog::warn("SyncBridge: '{}' changed but could not be read, skipping refresh", m_Key);
        return false;
    }

    auto snapshot = m_Codec.Decode(*text);
    if (!snapshot) {
        spdlog::warn("SyncBridge: '{}' changed to an unreadable blob, skipping refresh", m_Key);
        return false;
    }

    spdlog::debug("SyncBridge: applying external snapshot of '{}'", m_Key);
    m_Hydrating = true;
    try {
        apply(std::move(*snapshot));
    } catch (...) {
        m_Hydrating = false;
        throw;
    }
    m_Hydrating = false;
    return true;
}
