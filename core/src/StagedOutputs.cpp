#include "bc/core/util/StagedOutputs.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Logging.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace bc {

StagedOutputs::StagedOutputs(fs::path root) : root_(std::move(root)) {}

StagedOutputs::~StagedOutputs()
{
    discard();
}

fs::path StagedOutputs::stage(const fs::path& relative)
{
    Entry e;
    e.target = root_ / relative;
    e.temp = e.target;
    e.temp += kSuffix;

    std::error_code ec;
    fs::create_directories(e.target.parent_path(), ec);
    if (ec) {
        throw IOError("cannot create directory " + e.target.parent_path().string() +
                      ": " + ec.message());
    }
    staged_.push_back(e);
    return e.temp;
}

void StagedOutputs::commit()
{
    std::vector<Entry> moved;
    for (auto it = staged_.begin(); it != staged_.end();) {
        std::error_code ec;
        fs::rename(it->temp, it->target, ec);
        if (ec) {
            const std::string msg = "cannot move " + it->temp.string() + " to " +
                                    it->target.string() + ": " + ec.message();
            rollback(moved);
            throw IOError(msg);
        }
        moved.push_back(*it);
        it = staged_.erase(it);
    }
    for (const auto& e : moved)
        committed_.push_back(e.target);
}

// Move already-renamed files back to their temporary names so discard()
// removes them with the rest of the group.
void StagedOutputs::rollback(const std::vector<Entry>& moved)
{
    for (auto it = moved.rbegin(); it != moved.rend(); ++it) {
        std::error_code ec;
        fs::rename(it->target, it->temp, ec);
        if (ec) {
            Logger()->warn("could not roll back {}: {}", it->target.string(), ec.message());
            fs::remove(it->target, ec);
            continue;
        }
        staged_.push_back(*it);
    }
}

void StagedOutputs::discard() noexcept
{
    for (const auto& e : staged_) {
        std::error_code ec;
        if (fs::remove(e.temp, ec)) {
            Logger()->debug("discarded partial output {}", e.temp.string());
        } else if (ec) {
            Logger()->warn("could not remove partial output {}: {}", e.temp.string(), ec.message());
        }
    }
    staged_.clear();
}

void writeAtomically(const fs::path& target,
                     const std::function<void(const fs::path&)>& write)
{
    StagedOutputs out(target.parent_path());
    write(out.stage(target.filename()));
    out.commit();
}

} // namespace bc
