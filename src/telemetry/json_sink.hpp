/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, null.
 * @author ConstellationPlanner contributors
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace constellation_planner {

/**
 * @brief Writes NDJSON to <log_dir>/<prefix>.ndjson with size-based rotation.
 *
 * When a write would push the active file past the size limit, the file
 * becomes <prefix>.1.ndjson, older files shift up by one and anything
 * beyond @p max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint64_t max_file_size_bytes = 50ULL * 1024 * 1024,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    JsonFileSink(const JsonFileSink&) = delete;
    JsonFileSink& operator=(const JsonFileSink&) = delete;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path active_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;
    [[nodiscard]] bool is_open() const noexcept { return current_file_.is_open(); }

private:
    void rotate_if_needed(size_t incoming);
    void rotate();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and the CLI.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/// MB from configuration to bytes.
[[nodiscard]] constexpr uint64_t megabytes(uint32_t mb) noexcept {
    return static_cast<uint64_t>(mb) * 1024 * 1024;
}

}  // namespace constellation_planner
