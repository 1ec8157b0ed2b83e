#include "toolroute/storage/jsonl.hpp"
#include "toolroute/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <map>
#include <memory>

namespace toolroute::storage {

namespace {

// Invalid UTF-8 in strings becomes U+FFFD instead of throwing
std::string to_line(const Json& entry) {
    return entry.dump(-1, ' ', false, Json::error_handler_t::replace) + '\n';
}

std::string serialize(const std::vector<Json>& entries) {
    std::string content;
    for (const auto& entry : entries) {
        content += to_line(entry);
    }
    return content;
}

Result<void, Error> ensure_parent(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::err(
                ErrorCode::StorageWriteFailed,
                "Cannot create directory: " + ec.message(),
                path.parent_path().string()
            );
        }
    }
    return Result<void, Error>::ok();
}

bool ends_with_newline(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in || in.tellg() <= 0) {
        return true;
    }
    in.seekg(-1, std::ios::end);
    char last = '\n';
    in.get(last);
    return last == '\n';
}

}  // namespace

JsonlFile::JsonlFile(fs::path path)
    : path_(std::move(path))
{
}

std::mutex& JsonlFile::lock_for(const fs::path& path) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>> registry;

    std::error_code ec;
    fs::path key = fs::weakly_canonical(path, ec);
    if (ec) {
        key = path.lexically_normal();
    }

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& slot = registry[key.string()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

Result<std::vector<Json>, Error> JsonlFile::read_unlocked() const {
    using R = Result<std::vector<Json>, Error>;
    std::vector<Json> entries;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return R::ok(std::move(entries));
    }

    std::ifstream in(path_);
    if (!in) {
        return R::err(ErrorCode::StorageReadFailed, "Cannot open file for reading", path_.string());
    }

    std::vector<std::string> corrupt;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        Json parsed = Json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::warn("Skipped corrupt line {} in {}", line_no, path_.string());
            corrupt.push_back(line);
            continue;
        }
        entries.push_back(std::move(parsed));
    }

    if (!corrupt.empty()) {
        fs::path quarantine = path_;
        quarantine += ".corrupt";
        std::ofstream out(quarantine, std::ios::app);
        for (const auto& bad : corrupt) {
            out << bad << '\n';
        }
        if (out) {
            spdlog::warn("Quarantined {} corrupt line(s) to {}", corrupt.size(), quarantine.string());
        } else {
            spdlog::error("Failed to write quarantine file {}", quarantine.string());
        }
    }

    return R::ok(std::move(entries));
}

Result<void, Error> JsonlFile::write_unlocked(const std::string& content) const {
    TOOLROUTE_TRY_VOID(ensure_parent(path_));

    std::error_code ec;
    fs::path temp = path_;
    temp += ".tmp." + generate_temp_suffix();

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return Result<void, Error>::err(
                ErrorCode::StorageWriteFailed, "Failed to write temporary file", temp.string());
        }
    }

    fs::rename(temp, path_, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(temp, cleanup);
        return Result<void, Error>::err(
            ErrorCode::StorageWriteFailed,
            "Failed to replace file: " + ec.message(),
            path_.string()
        );
    }

    return Result<void, Error>::ok();
}

Result<std::vector<Json>, Error> JsonlFile::read_all() const {
    std::lock_guard<std::mutex> lock(lock_for(path_));
    return read_unlocked();
}

Result<void, Error> JsonlFile::write_all(const std::vector<Json>& entries) const {
    std::lock_guard<std::mutex> lock(lock_for(path_));
    return write_unlocked(serialize(entries));
}

Result<void, Error> JsonlFile::append(const Json& entry) const {
    std::lock_guard<std::mutex> lock(lock_for(path_));
    TOOLROUTE_TRY_VOID(ensure_parent(path_));

    std::string line = to_line(entry);
    if (!ends_with_newline(path_)) {
        line.insert(line.begin(), '\n');
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    out << line;
    out.flush();
    if (!out) {
        return Result<void, Error>::err(
            ErrorCode::StorageWriteFailed, "Failed to append to file", path_.string());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> JsonlFile::update(const Mutator& mutate) const {
    std::lock_guard<std::mutex> lock(lock_for(path_));

    auto entries = read_unlocked();
    if (entries.is_err()) {
        return Result<void, Error>::err(std::move(entries).error());
    }

    auto& values = entries.value();
    TOOLROUTE_TRY_VOID(mutate(values));
    return write_unlocked(serialize(values));
}

}  // namespace toolroute::storage
