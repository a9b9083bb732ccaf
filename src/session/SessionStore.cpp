#include "session/SessionStore.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace letterfall::session {

namespace fs = std::filesystem;

FileSessionStore::FileSessionStore(fs::path path)
    : path_{std::move(path)}
{
    if (path_.empty()) {
        throw std::invalid_argument("FileSessionStore: empty path");
    }
}

fs::path FileSessionStore::tempPath() const {
    fs::path tmp = path_;
    tmp += ".tmp";
    return tmp;
}

std::optional<std::string> FileSessionStore::read() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        std::cerr << "SessionStore: failed reading " << path_ << "\n";
        return std::nullopt;
    }
    return bytes;
}

void FileSessionStore::write(const std::string& bytes) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("FileSessionStore: cannot create " +
                                     path_.parent_path().string() + ": " + ec.message());
        }
    }

    const fs::path tmp = tempPath();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("FileSessionStore: cannot open " + tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw std::runtime_error("FileSessionStore: write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("FileSessionStore: cannot replace " + path_.string() +
                                 ": " + ec.message());
    }
}

void FileSessionStore::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "SessionStore: cannot remove " << path_ << ": " << ec.message() << "\n";
    }
    fs::remove(tempPath(), ec);
}

bool FileSessionStore::hasSession() {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

} // namespace letterfall::session
