/**
 * @file log_sinks.hpp
 * @brief ILogSink implementations: rotating NDJSON file, stdout, null, memory.
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

namespace server_browser {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<prefix>.ndjson`. When it exceeds the size limit it is
 * renamed to `<prefix>.1.ndjson`, older generations shift up by one, and
 * anything beyond `max_files` is deleted.
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

    /// Size limit in bytes; exposed so tests can force rotation cheaply.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps every line in memory. Shared ownership lets a test inspect
 *        lines after handing the sink to a Logger.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    MemorySink() : buffer_(std::make_shared<Buffer>()) {}
    explicit MemorySink(std::shared_ptr<Buffer> buffer) : buffer_(std::move(buffer)) {}

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const { return buffer_; }

private:
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace server_browser
