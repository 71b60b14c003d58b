#pragma once

#include "bc/core/types/ResultTable.hpp"
#include "bc/pipeline/PipelineParams.hpp"
#include "bc/pipeline/ReportWriter.hpp"
#include "bc/pipeline/RoiProvider.hpp"
#include "bc/pipeline/SeriesFilter.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace bc::lif {
class LifReader;
}

namespace bc {

// A container or series that could not be processed.
struct FailureRecord {
    std::string container;
    long seriesIndex = -1;       ///< -1 when the whole container failed
    std::string seriesName;
    std::string kind;            ///< exception category, e.g. "FormatError"
    std::string message;
};

struct RunSummary {
    size_t containers = 0;
    size_t containersFailed = 0;
    size_t seriesSeen = 0;
    size_t seriesProcessed = 0;
    size_t seriesSkipped = 0;    ///< operator returned no ROIs
    size_t seriesFiltered = 0;   ///< excluded by the name filter
    size_t seriesFailed = 0;
    size_t cellsMeasured = 0;
    size_t cellsRejected = 0;
    std::vector<FailureRecord> failures;
    bool cancelled = false;

    [[nodiscard]] bool hasFailures() const { return !failures.empty(); }
};

// Everything a run needs, passed explicitly instead of held in globals.
struct PipelineContext {
    PipelineParams params;
    std::filesystem::path inputRoot;
    std::filesystem::path outputRoot;
    const std::atomic<bool>* cancel = nullptr;

    ResultTable results;
    RunSummary summary;

    std::string container;       ///< current container, for diagnostics
    std::string series;          ///< current series name
};

/**
 * @brief Discover, project, acquire ROIs, count and report
 *
 * Containers and series are processed one at a time. Per-container and
 * per-series failures are recorded in the summary and the run continues.
 * Full_Results.csv is checkpointed after every processed series (a failed
 * checkpoint is only a warning) and written at the end of the run.
 */
class Pipeline {
public:
    Pipeline(PipelineParams params,
             std::filesystem::path inputRoot,
             std::filesystem::path outputRoot,
             RoiProvider& provider,
             const std::atomic<bool>* cancel = nullptr);

    /**
     * @throws bc::IOError if the input root cannot be listed or the output
     *         root cannot be created or written
     * @throws std::runtime_error for an invalid configuration
     */
    const RunSummary& run();

    [[nodiscard]] const PipelineContext& context() const { return ctx_; }
    [[nodiscard]] const RunSummary& summary() const { return ctx_.summary; }
    [[nodiscard]] const ResultTable& results() const { return ctx_.results; }

private:
    void processContainer(const std::filesystem::path& container);
    void processSeries(const lif::LifReader& reader, size_t index);
    void recordFailure(long seriesIndex, const std::string& seriesName,
                       const std::string& kind, const std::string& message);
    void checkCancelled() const;
    void checkOutputWritable() const;
    void checkpointResults() const;

    PipelineContext ctx_;
    RoiProvider& provider_;
    SeriesFilter filter_;
    ReportWriter report_;
    std::set<std::string> writtenSeries_;
};

// Human-readable run summary, one item per line.
std::vector<std::string> describeSummary(const RunSummary& summary);

} // namespace bc
