#include "blob_store.hpp"

// ─────────────────────────────────────
MemoryBlobStore::MemoryBlobStore(std::shared_ptr<MemoryBlobBus> bus) : m_Bus(std::move(bus)) {
}

// ─────────────────────────────────────
std::optional<std::string> MemoryBlobStore::Read(const std::string &key) {
    auto it = m_Bus->records.find(key);
    if (it == m_Bus->records.end()) {
        return std::nullopt;
    }
    m_Known[key] = it->second.revision;
    return it->second.value;
}

// ─────────────────────────────────────
bool MemoryBlobStore::Write(const std::string &key, const std::string &value,
                            std::string &error) {
    error.clear();
    auto &record = m_Bus->records[key];
    record.value = value;
    record.revision += 1;
    m_Known[key] = record.revision;
    return true;
}

// ─────────────────────────────────────
std::vector<std::string> MemoryBlobStore::PollChangedKeys() {
    std::vector<std::string> changed;
    for (const auto &[key, record] : m_Bus->records) {
        auto known = m_Known.find(key);
        if (known == m_Known.end() || known->second != record.revision) {
            changed.push_back(key);
        }
    }
    return changed;
}
