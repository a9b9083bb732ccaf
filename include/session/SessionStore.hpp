#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace letterfall::session {

// Where serialized sessions live. One slot per store.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // std::nullopt when nothing has been saved
    virtual std::optional<std::string> read() = 0;

    // Replace the stored bytes; throws std::runtime_error on failure
    virtual void write(const std::string& bytes) = 0;

    virtual void clear() = 0;

    virtual bool hasSession() = 0;
};

// Single file on disk. Writes go to a sibling temp file that is then
// renamed over the target, so a crash never leaves a half-written session.
class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(std::filesystem::path path);

    const std::filesystem::path& path() const noexcept { return path_; }

    std::optional<std::string> read() override;
    void write(const std::string& bytes) override;
    void clear() override;
    bool hasSession() override;

private:
    std::filesystem::path path_;

    std::filesystem::path tempPath() const;
};

} // namespace letterfall::session
