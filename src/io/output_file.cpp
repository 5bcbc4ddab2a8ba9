#include "output_file.hpp"
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace poolrisk {
namespace io {

namespace fs = std::filesystem;

namespace {

void remove_quietly(const std::string& path) noexcept {
    std::error_code ignored;
    fs::remove(path, ignored);
}

} // anonymous namespace

std::string temporary_path_for(const std::string& filepath) {
    return filepath + ".tmp";
}

// ============================================================================
// OutputBatch Implementation
// ============================================================================

OutputBatch::~OutputBatch() {
    discard();
}

void OutputBatch::add(const std::string& filepath, const std::function<void(std::ostream&)>& write) {
    add_file(filepath, [&](const std::string& temporary) {
        std::ofstream file(temporary, std::ios::out | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open output file: " + filepath);
        }
        write(file);
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write output file: " + filepath);
        }
    });
}

void OutputBatch::add_file(const std::string& filepath,
                           const std::function<void(const std::string&)>& write) {
    const std::string temporary = temporary_path_for(filepath);
    try {
        write(temporary);
    } catch (const std::exception&) {
        remove_quietly(temporary);
        throw;
    }
    staged_.push_back({temporary, filepath});
}

void OutputBatch::commit() {
    for (size_t i = 0; i < staged_.size(); ++i) {
        std::error_code ec;
        fs::rename(staged_[i].temporary, staged_[i].filepath, ec);
        if (ec) {
            const std::string message = "Failed to move " + staged_[i].temporary + " to " +
                                        staged_[i].filepath + ": " + ec.message();
            for (size_t j = 0; j < i; ++j) {
                remove_quietly(staged_[j].filepath);
            }
            staged_.erase(staged_.begin(), staged_.begin() + static_cast<std::ptrdiff_t>(i));
            discard();
            throw std::runtime_error(message);
        }
    }
    staged_.clear();
}

void OutputBatch::discard() noexcept {
    for (const auto& staged : staged_) {
        remove_quietly(staged.temporary);
    }
    staged_.clear();
}

void write_file_atomically(const std::string& filepath,
                           const std::function<void(std::ostream&)>& write) {
    OutputBatch batch;
    batch.add(filepath, write);
    batch.commit();
}

} // namespace io
} // namespace poolrisk
