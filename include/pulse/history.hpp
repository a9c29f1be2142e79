#ifndef PULSE_HISTORY_HPP
#define PULSE_HISTORY_HPP

#include "message.hpp"
#include "transfer.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace Pulse {

    // One completed transfer, as handed to the history store.
    struct HistoryRecord {
        std::chrono::system_clock::time_point time;
        std::string direction;  // "send" or "receive"
        std::string filename;
        uint64_t size = 0;
        std::chrono::milliseconds duration{0};
        double speed = 0.0;  // bytes per second
        std::string status;
        std::string checksum;

        static HistoryRecord completed(const std::string& direction, const Metadata& metadata, const Stats& stats);
    };

    void to_json(nlohmann::json& j, const HistoryRecord& entry);
    void from_json(const nlohmann::json& j, HistoryRecord& entry);

    /**
     * @brief Append-only destination for history records. The transfer engine never reads back.
     */
    class HistorySink {
    public:
        virtual ~HistorySink() = default;
        virtual void record(const HistoryRecord& entry) = 0;
    };

    /**
     * @brief Keeps the most recent records as a JSON array in a file.
     *
     * Each record() rewrites the whole file; only the last MAX_ENTRIES records survive.
     */
    class FileHistorySink : public HistorySink {
    public:
        static constexpr std::size_t MAX_ENTRIES = 100;

        explicit FileHistorySink(std::filesystem::path path);

        // $HOME/.pulse/history.json
        static std::filesystem::path default_path();

        /**
         * @throws Pulse::RuntimeError if the file cannot be read, parsed or written.
         */
        void record(const HistoryRecord& entry) override;

        /**
         * @brief Reads back every stored record, oldest first. A missing file holds none.
         * @throws Pulse::RuntimeError if the file exists but is not a valid history.
         */
        std::vector<HistoryRecord> load() const;

        const std::filesystem::path& path() const { return path_; }

    private:
        std::vector<HistoryRecord> load_unlocked() const;

        std::filesystem::path path_;
        mutable std::mutex mutex_;
    };

} // namespace Pulse

#endif // PULSE_HISTORY_HPP
