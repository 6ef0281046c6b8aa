// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_stream_source.h"

#include <spdlog/spdlog.h>

namespace bricklayers {
namespace gcode {

// ============================================================================
// FileStreamSource
// ============================================================================

FileStreamSource::FileStreamSource(const std::filesystem::path& path) : path_(path) {
    std::error_code ec;
    expected_size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        error_ = "cannot stat file: " + ec.message();
        spdlog::warn("[FileStreamSource] {}: {}", path_.string(), error_);
        return;
    }

    file_.open(path_, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        error_ = "cannot open file";
        spdlog::warn("[FileStreamSource] Failed to open file: {}", path_.string());
    }
}

std::string FileStreamSource::describe() const {
    return path_.string();
}

ReadStatus FileStreamSource::fail(const std::string& what) {
    error_ = what;
    file_.close();
    return ReadStatus::ERROR;
}

ReadStatus FileStreamSource::next_line(std::string& out) {
    if (!error_.empty()) {
        return ReadStatus::ERROR;
    }
    if (finished_) {
        return ReadStatus::END;
    }

    if (std::getline(file_, out)) {
        bytes_read_ += out.size() + (file_.eof() ? 0 : 1);
        if (!out.empty() && out.back() == '\r') {
            out.pop_back();
        }
        return ReadStatus::LINE;
    }

    if (file_.bad()) {
        return fail("read error");
    }

    if (bytes_read_ != expected_size_) {
        return fail("stream truncated: read " + std::to_string(bytes_read_) + " of " +
                    std::to_string(expected_size_) + " bytes");
    }

    finished_ = true;
    return ReadStatus::END;
}

// ============================================================================
// StringStreamSource
// ============================================================================

StringStreamSource::StringStreamSource(std::string content, std::string name)
    : stream_(std::move(content)), name_(std::move(name)) {}

ReadStatus StringStreamSource::next_line(std::string& out) {
    if (std::getline(stream_, out)) {
        if (!out.empty() && out.back() == '\r') {
            out.pop_back();
        }
        return ReadStatus::LINE;
    }
    return ReadStatus::END;
}

} // namespace gcode
} // namespace bricklayers
