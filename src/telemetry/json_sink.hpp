/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, null, in-memory.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace grid_deploy {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * `<prefix>.ndjson` is the live file; on rotation it becomes
 * `<prefix>.1.ndjson`, older files shift up, and files beyond `max_files`
 * are deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

    /// Rotation threshold in bytes (tests lower it).
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
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

/**
 * @brief Keeps lines in memory; the buffer outlives the sink when shared.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        mutable std::mutex mutex;
        std::vector<std::string> lines;

        [[nodiscard]] std::vector<std::string> snapshot() const;
        [[nodiscard]] size_t count_containing(std::string_view needle) const;
    };

    MemorySink();
    explicit MemorySink(std::shared_ptr<Buffer> buffer);

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const { return buffer_; }

private:
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace grid_deploy
