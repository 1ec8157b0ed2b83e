#pragma once

#include "toolroute/core/result.hpp"
#include "toolroute/core/types.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>

namespace toolroute::storage {

using namespace toolroute::core;
namespace fs = std::filesystem;

// One JSON value per line.
//
// append() writes one line at the end of the file. write_all() and update()
// go to <file>.tmp.<uuid> and rename it over the target. A torn last line
// left by a crash is quarantined on the next read. All writers of the same
// path in this process are serialized through a shared mutex.
class JsonlFile {
public:
    explicit JsonlFile(fs::path path);

    // Missing file reads as empty. Lines that fail to parse are skipped and
    // appended to <file>.corrupt.
    Result<std::vector<Json>, Error> read_all() const;

    Result<void, Error> write_all(const std::vector<Json>& entries) const;

    Result<void, Error> append(const Json& entry) const;

    // Read-modify-write under the path lock
    using Mutator = std::function<Result<void, Error>(std::vector<Json>&)>;
    Result<void, Error> update(const Mutator& mutate) const;

    const fs::path& path() const { return path_; }

    // Process-wide lock for a path
    static std::mutex& lock_for(const fs::path& path);

private:
    fs::path path_;

    Result<std::vector<Json>, Error> read_unlocked() const;
    Result<void, Error> write_unlocked(const std::string& content) const;
};

}  // namespace toolroute::storage
