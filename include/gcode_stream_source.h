// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace bricklayers {
namespace gcode {

/**
 * @brief Outcome of reading one line from a stream source
 */
enum class ReadStatus {
    LINE,  ///< A line was produced
    END,   ///< Clean end of stream
    ERROR, ///< I/O failure or truncation; the stream cannot be trusted
};

/**
 * @brief Sequential read access to a job's full command stream
 *
 * Lines are numbered by the reader from 1 in the order produced; that number
 * is the StreamPosition the host uses when it later issues the same line.
 */
class GCodeStreamSource {
  public:
    virtual ~GCodeStreamSource() = default;

    /**
     * @brief Read the next line (without its newline)
     *
     * After END or ERROR further calls keep returning the same status.
     */
    virtual ReadStatus next_line(std::string& out) = 0;

    /// Description for log messages (file path, "<memory>", ...)
    virtual std::string describe() const = 0;

    /// Error text after ERROR, empty otherwise
    virtual std::string error_message() const {
        return {};
    }
};

/**
 * @brief Stream source reading a G-code file
 *
 * The file size is captured when the file is opened; reaching end-of-file
 * with a different number of bytes consumed is reported as truncation.
 */
class FileStreamSource : public GCodeStreamSource {
  public:
    explicit FileStreamSource(const std::filesystem::path& path);

    // Non-copyable (owns the file handle)
    FileStreamSource(const FileStreamSource&) = delete;
    FileStreamSource& operator=(const FileStreamSource&) = delete;

    ReadStatus next_line(std::string& out) override;
    std::string describe() const override;
    std::string error_message() const override {
        return error_;
    }

    bool is_open() const {
        return file_.is_open();
    }

  private:
    ReadStatus fail(const std::string& what);

    std::filesystem::path path_;
    std::ifstream file_;
    uintmax_t expected_size_ = 0;
    uintmax_t bytes_read_ = 0;
    bool finished_ = false;
    std::string error_;
};

/**
 * @brief Stream source over in-memory G-code
 */
class StringStreamSource : public GCodeStreamSource {
  public:
    explicit StringStreamSource(std::string content, std::string name = "<memory>");

    ReadStatus next_line(std::string& out) override;
    std::string describe() const override {
        return name_;
    }

  private:
    std::istringstream stream_;
    std::string name_;
};

} // namespace gcode
} // namespace bricklayers
