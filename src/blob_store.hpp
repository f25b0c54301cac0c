#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Keyed storage shared by several surfaces. Each handle remembers the revision of every
// key it has read or written, so it can tell writes made through other handles apart from
// its own.
class BlobStore {
  public:
    virtual ~BlobStore() = default;

    virtual std::optional<std::string> Read(const std::string &key) = 0;
    virtual bool Write(const std::string &key, const std::string &value, std::string &error) = 0;

    // Keys written through another handle since this handle last read or wrote them.
    // Never reports this handle's own writes.
    virtual std::vector<std::string> PollChangedKeys() = 0;
};

// In-process stand-in for the shared storage: several MemoryBlobStore handles attached to
// one bus behave like surfaces sharing a database.
class MemoryBlobBus {
  public:
    struct Record {
        std::string value;
        std::int64_t revision = 0;
    };

    std::unordered_map<std::string, Record> records;
};

class MemoryBlobStore : public BlobStore {
  public:
    explicit MemoryBlobStore(std::shared_ptr<MemoryBlobBus> bus);

    std::optional<std::string> Read(const std::string &key) override;
    bool Write(const std::string &key, const std::string &value, std::string &error) override;
    std::vector<std::string> PollChangedKeys() override;

  private:
    std::shared_ptr<MemoryBlobBus> m_Bus;
    std::unordered_map<std::string, std::int64_t> m_Known;
};
