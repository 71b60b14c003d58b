#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace bc {

/**
 * @brief Group of output files that appear together or not at all
 *
 * stage() hands out "<target>.partial" paths to write to. commit() renames
 * every staged file onto its target; if one rename fails, the files already
 * moved are taken back and commit() throws bc::IOError. Files still staged
 * when the object is destroyed (failure, cancellation) are deleted.
 */
class StagedOutputs {
public:
    explicit StagedOutputs(std::filesystem::path root);
    ~StagedOutputs();

    StagedOutputs(const StagedOutputs&) = delete;
    StagedOutputs& operator=(const StagedOutputs&) = delete;

    // Register `relative` (to the root) and return the temporary path to write.
    std::filesystem::path stage(const std::filesystem::path& relative);

    void commit();
    void discard() noexcept;

    [[nodiscard]] const std::vector<std::filesystem::path>& committed() const { return committed_; }
    [[nodiscard]] size_t pending() const { return staged_.size(); }

    static constexpr const char* kSuffix = ".partial";

private:
    struct Entry {
        std::filesystem::path temp;
        std::filesystem::path target;
    };

    void rollback(const std::vector<Entry>& moved);

    std::filesystem::path root_;
    std::vector<Entry> staged_;
    std::vector<std::filesystem::path> committed_;
};

// Write `target` through a temporary file and rename it into place.
void writeAtomically(const std::filesystem::path& target,
                     const std::function<void(const std::filesystem::path&)>& write);

} // namespace bc
