#include "bc/pipeline/Pipeline.hpp"
#include "bc/core/lif/LifReader.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/FileDiscovery.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/core/util/MaxProjection.hpp"
#include "bc/core/util/StagedOutputs.hpp"
#include "bc/pipeline/CellAggregator.hpp"
#include "bc/pipeline/PipelineParamsIO.hpp"

#include <fstream>
#include <memory>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fs = std::filesystem;

namespace bc {

namespace {

const std::string& checkedPattern(const PipelineParams& p)
{
    pipeline::validate(p);
    return p.series_pattern;
}

} // namespace

Pipeline::Pipeline(PipelineParams params,
                   fs::path inputRoot,
                   fs::path outputRoot,
                   RoiProvider& provider,
                   const std::atomic<bool>* cancel)
    : provider_(provider),
      filter_(params.choose_lng, checkedPattern(params)),
      report_(outputRoot)
{
    ctx_.params = std::move(params);
    ctx_.inputRoot = std::move(inputRoot);
    ctx_.outputRoot = std::move(outputRoot);
    ctx_.cancel = cancel;
}

void Pipeline::checkCancelled() const
{
    if (ctx_.cancel && ctx_.cancel->load())
        throw Cancelled();
}

void Pipeline::recordFailure(long seriesIndex, const std::string& seriesName,
                             const std::string& kind, const std::string& message)
{
    FailureRecord f;
    f.container = ctx_.container;
    f.seriesIndex = seriesIndex;
    f.seriesName = seriesName;
    f.kind = kind;
    f.message = message;

    if (seriesIndex < 0) {
        ++ctx_.summary.containersFailed;
        Logger()->error("{}: {} ({}), container skipped", f.container, f.message, f.kind);
    } else {
        ++ctx_.summary.seriesFailed;
        Logger()->error("{} series {} '{}': {} ({}), series skipped",
                        f.container, f.seriesIndex, f.seriesName, f.message, f.kind);
    }
    ctx_.summary.failures.push_back(std::move(f));
}

// Stages and discards a scratch file; Full_Results.csv is not touched.
void Pipeline::checkOutputWritable() const
{
    StagedOutputs probe(ctx_.outputRoot);
    const fs::path tmp = probe.stage(".bc_write_test");
    std::ofstream out(tmp, std::ios::trunc);
    out << "ok\n";
    out.close();
    if (!out)
        throw IOError("output directory " + ctx_.outputRoot.string() + " is not writable");
}

void Pipeline::checkpointResults() const
{
    try {
        report_.writeResults(ctx_.results);
    } catch (const IOError& e) {
        Logger()->warn("could not checkpoint {}: {}", ReportWriter::kResultsFile, e.what());
    }
}

const RunSummary& Pipeline::run()
{
    RunSummary& s = ctx_.summary;

    const auto containers = discoverContainers(ctx_.inputRoot, ctx_.params.extension);
    s.containers = containers.size();

    std::error_code ec;
    fs::create_directories(ctx_.outputRoot, ec);
    if (ec)
        throw IOError("cannot create output directory " + ctx_.outputRoot.string() + ": " + ec.message());
    checkOutputWritable();

#ifdef _OPENMP
    if (ctx_.params.threads > 0)
        omp_set_num_threads(ctx_.params.threads);
#endif

    try {
        for (const auto& container : containers) {
            checkCancelled();
            processContainer(container);
        }
    } catch (const Cancelled& e) {
        s.cancelled = true;
        Logger()->warn("{}; keeping results of completed series", e.what());
    }

    ctx_.container.clear();
    ctx_.series.clear();
    report_.writeResults(ctx_.results);

    for (const auto& line : describeSummary(s))
        Logger()->info("{}", line);
    return s;
}

void Pipeline::processContainer(const fs::path& container)
{
    ctx_.container = container.string();
    ctx_.series.clear();
    ScopedLogContext logContext(container.filename().string());

    std::unique_ptr<lif::LifReader> reader;
    try {
        reader = std::make_unique<lif::LifReader>(container);
    } catch (const FormatError& e) {
        recordFailure(-1, "", "FormatError", e.what());
        return;
    } catch (const IOError& e) {
        recordFailure(-1, "", "IOError", e.what());
        return;
    }

    Logger()->info("{} image series", reader->seriesCount());
    for (size_t i = 0; i < reader->seriesCount(); ++i) {
        checkCancelled();
        processSeries(*reader, i);
    }
}

void Pipeline::processSeries(const lif::LifReader& reader, size_t index)
{
    RunSummary& s = ctx_.summary;
    const SeriesInfo& info = reader.info(index);
    const long seriesIndex = static_cast<long>(index);
    ctx_.series = info.name;
    ScopedLogContext logContext(reader.path().filename().string() + " #" + std::to_string(index) + " " + info.name);
    ++s.seriesSeen;

    if (!filter_.accepts(info.name)) {
        ++s.seriesFiltered;
        Logger()->info("name does not match '{}', skipped", ctx_.params.series_pattern);
        return;
    }

    const int channel = ctx_.params.channel;
    try {
        const Projection projection = [&] {
            const Series series = reader.read(index);
            return maxIntensityProjection(series);
        }();
        if (channel > static_cast<int>(projection.channels.size())) {
            throw ShapeError("channel " + std::to_string(channel) + " requested but the series has " +
                             std::to_string(projection.channels.size()));
        }

        const std::vector<Roi> rois = provider_.acquire(projection, channel);
        if (rois.empty()) {
            ++s.seriesSkipped;
            Logger()->info("no ROIs, series skipped");
            return;
        }
        checkCancelled();

        const SpotDetector detector(ctx_.params.detectorParams());
        const auto cells = measureCells(projection, rois, detector, channel);

        std::vector<ResultRow> rows;
        for (const auto& cell : cells) {
            if (!cell.measured()) {
                ++s.cellsRejected;
                Logger()->warn("{} rejected: {}", cell.label, *cell.error);
                continue;
            }
            Logger()->debug("{}: {} spots, area {}", cell.label, cell.spots.size(), cell.area);
            rows.push_back({info.name, cell.label, cell.spots.size(), cell.area});
        }
        if (rows.empty()) {
            ++s.seriesSkipped;
            Logger()->warn("none of {} ROIs could be measured, series skipped", rois.size());
            return;
        }

        if (writtenSeries_.count(info.name))
            Logger()->warn("outputs of an earlier series named {} are overwritten", info.name);

        StagedOutputs staged(ctx_.outputRoot);
        report_.writeSeries(staged, projection, channel, rois, cells);
        checkCancelled();
        staged.commit();
        writtenSeries_.insert(info.name);

        ctx_.results.append(rows);
        s.cellsMeasured += rows.size();
        ++s.seriesProcessed;
        Logger()->info("{} of {} cells measured", rows.size(), rois.size());
    } catch (const Cancelled&) {
        throw;
    } catch (const ShapeError& e) {
        recordFailure(seriesIndex, info.name, "ShapeError", e.what());
        return;
    } catch (const FormatError& e) {
        recordFailure(seriesIndex, info.name, "FormatError", e.what());
        return;
    } catch (const IOError& e) {
        recordFailure(seriesIndex, info.name, "IOError", e.what());
        return;
    } catch (const std::exception& e) {
        recordFailure(seriesIndex, info.name, "error", e.what());
        return;
    }

    checkpointResults();
}

std::vector<std::string> describeSummary(const RunSummary& s)
{
    std::vector<std::string> lines;
    lines.push_back(std::string(s.cancelled ? "run cancelled" : "run complete") + ": " +
                    std::to_string(s.containers) + " container(s), " +
                    std::to_string(s.seriesSeen) + " series seen");
    lines.push_back("  processed " + std::to_string(s.seriesProcessed) +
                    ", skipped by operator " + std::to_string(s.seriesSkipped) +
                    ", filtered by name " + std::to_string(s.seriesFiltered) +
                    ", failed " + std::to_string(s.seriesFailed));
    lines.push_back("  cells measured " + std::to_string(s.cellsMeasured) +
                    ", rejected " + std::to_string(s.cellsRejected));
    if (s.containersFailed > 0)
        lines.push_back("  unreadable containers " + std::to_string(s.containersFailed));
    for (const auto& f : s.failures) {
        std::string where = f.container;
        if (f.seriesIndex >= 0)
            where += " #" + std::to_string(f.seriesIndex) + " " + f.seriesName;
        lines.push_back("  FAILED " + where + ": " + f.kind + ": " + f.message);
    }
    return lines;
}

} // namespace bc
