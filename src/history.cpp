#include "pulse/history.hpp"
#include "pulse/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace Pulse {

namespace {

constexpr char TIME_FORMAT[] = "%Y-%m-%dT%H:%M:%SZ";

std::string format_time(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, TIME_FORMAT);
    return out.str();
}

std::chrono::system_clock::time_point parse_time(const std::string& text) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, TIME_FORMAT);
    if (in.fail()) {
        throw RuntimeError("Invalid time in history file: " + text);
    }
    return std::chrono::system_clock::from_time_t(timegm(&utc));
}

} // namespace

HistoryRecord HistoryRecord::completed(const std::string& direction, const Metadata& metadata, const Stats& stats) {
    HistoryRecord entry;
    entry.time = std::chrono::system_clock::now();
    entry.direction = direction;
    entry.filename = metadata.filename;
    entry.size = metadata.size;
    entry.duration = stats.duration;
    entry.speed = stats.average_speed;
    entry.status = "ok";
    entry.checksum = metadata.checksum;
    return entry;
}

void to_json(nlohmann::json& j, const HistoryRecord& entry) {
    j = nlohmann::json{{"time", format_time(entry.time)},
                       {"direction", entry.direction},
                       {"filename", entry.filename},
                       {"size", entry.size},
                       {"duration_ms", entry.duration.count()},
                       {"speed", entry.speed},
                       {"status", entry.status},
                       {"checksum", entry.checksum}};
}

void from_json(const nlohmann::json& j, HistoryRecord& entry) {
    entry.time = parse_time(j.at("time").get<std::string>());
    j.at("direction").get_to(entry.direction);
    j.at("filename").get_to(entry.filename);
    j.at("size").get_to(entry.size);
    entry.duration = std::chrono::milliseconds(j.at("duration_ms").get<int64_t>());
    j.at("speed").get_to(entry.speed);
    j.at("status").get_to(entry.status);
    j.at("checksum").get_to(entry.checksum);
}

FileHistorySink::FileHistorySink(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path FileHistorySink::default_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        throw RuntimeError("HOME is not set; cannot locate history file.");
    }
    return std::filesystem::path(home) / ".pulse" / "history.json";
}

std::vector<HistoryRecord> FileHistorySink::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked();
}

std::vector<HistoryRecord> FileHistorySink::load_unlocked() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return {};
    }

    std::ifstream in(path_);
    if (!in) {
        throw RuntimeError("Failed to open history file: " + path_.string());
    }
    try {
        return nlohmann::json::parse(in).get<std::vector<HistoryRecord>>();
    } catch (const nlohmann::json::exception& e) {
        throw RuntimeError("Corrupt history file " + path_.string() + ": " + e.what());
    }
}

void FileHistorySink::record(const HistoryRecord& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw RuntimeError("Failed to create history directory: " + ec.message());
        }
    }

    std::vector<HistoryRecord> entries = load_unlocked();
    entries.push_back(entry);
    if (entries.size() > MAX_ENTRIES) {
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(MAX_ENTRIES));
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw RuntimeError("Failed to open history file: " + path_.string());
    }
    out << nlohmann::json(entries).dump(2) << '\n';
    out.close();
    if (!out) {
        throw RuntimeError("Failed to write history file: " + path_.string());
    }

    std::filesystem::permissions(path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw RuntimeError("Failed to restrict history file permissions: " + ec.message());
    }
}

} // namespace Pulse
