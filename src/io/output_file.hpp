#ifndef POOLRISK_IO_OUTPUT_FILE_HPP
#define POOLRISK_IO_OUTPUT_FILE_HPP

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace poolrisk {
namespace io {

// Path of the temporary sibling used while writing `filepath`
std::string temporary_path_for(const std::string& filepath);

/**
 * @brief Output files published together
 *
 * Each file is written to its temporary sibling when it is added; nothing
 * appears under its final name until commit(). Temporaries still pending
 * when the batch is destroyed are removed, so a run that fails after some
 * outputs were written leaves none of them behind.
 *
 * Usage:
 *   OutputBatch outputs;
 *   outputs.add("returns.csv", [&](std::ostream& os) { ... });
 *   outputs.add("risk.csv", [&](std::ostream& os) { ... });
 *   outputs.commit();
 */
class OutputBatch {
public:
    OutputBatch() = default;
    ~OutputBatch();

    OutputBatch(const OutputBatch&) = delete;
    OutputBatch& operator=(const OutputBatch&) = delete;

    // Write a text file through `write`.
    // Throws std::runtime_error if the file cannot be opened or written.
    void add(const std::string& filepath, const std::function<void(std::ostream&)>& write);

    // For writers that open the file themselves: `write` receives the
    // temporary path to create.
    void add_file(const std::string& filepath, const std::function<void(const std::string&)>& write);

    // Rename every staged file into place. If a rename fails, the files this
    // call already published and the remaining temporaries are removed and
    // std::runtime_error is thrown.
    void commit();

    size_t pending() const { return staged_.size(); }

private:
    struct Staged {
        std::string temporary;
        std::string filepath;
    };

    void discard() noexcept;

    std::vector<Staged> staged_;
};

// Write a single text file through a temporary sibling so readers never see
// a partially written file. The temporary is removed if `write` throws.
void write_file_atomically(const std::string& filepath,
                           const std::function<void(std::ostream&)>& write);

} // namespace io
} // namespace poolrisk

#endif // POOLRISK_IO_OUTPUT_FILE_HPP
