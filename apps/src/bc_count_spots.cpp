/**
 * @file bc_count_spots.cpp
 * @brief Count basal bodies per operator-drawn cell in LIF z-stacks
 *
 * Walks an input tree for LIF containers, projects every series, asks for
 * cell outlines (interactively or from saved RoiSet archives) and writes
 * per-cell spot counts, overlays, ROI archives and coordinate tables.
 *
 * Exit codes: 0 ok, 1 usage/config error, 2 input/output error,
 * 3 finished with failed containers or series, 130 cancelled.
 */

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "bc/core/Version.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/LoadJson.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/pipeline/Pipeline.hpp"
#include "bc/pipeline/PipelineParams.hpp"
#include "bc/pipeline/PipelineParamsIO.hpp"
#include "bc/pipeline/RoiProvider.hpp"
#include "bc/ui/HighguiRoiProvider.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitIo = 2;
constexpr int kExitPartial = 3;
constexpr int kExitCancelled = 130;

std::atomic<bool> g_cancel{false};

extern "C" void onSignal(int)
{
    g_cancel.store(true);
}

std::string promptDirectory(const std::string& question)
{
    std::cout << question << ": " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line))
        return {};
    // drag-and-drop into a terminal often adds quotes or a trailing space
    while (!line.empty() && (line.back() == ' ' || line.back() == '\r'))
        line.pop_back();
    if (line.size() >= 2 && (line.front() == '"' || line.front() == '\'') && line.back() == line.front())
        line = line.substr(1, line.size() - 2);
    return line;
}

} // namespace

int main(int argc, char* argv[])
{
    po::options_description desc(ProjectInfo::NameAndVersion() +
                                 " - basal body counting per cell\n\nUsage: bc_count_spots [options]");
    desc.add_options()
        ("help,h", "Show this help message")
        ("version", "Print version and exit")
        ("input,i", po::value<std::string>(), "Directory searched recursively for LIF files (prompted if absent)")
        ("output,o", po::value<std::string>(), "Directory receiving all results (prompted if absent)")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("maxima-tolerance", po::value<double>(), "Prominence of a counted maximum (default 50)")
        ("top-hat-radius", po::value<double>(), "Top-hat background radius in pixels, 0 = off (default 5)")
        ("median-radius", po::value<double>(), "Median filter radius in pixels, 0 = off (default 1)")
        ("choose-lng", po::bool_switch(), "Only process series whose name matches --series-pattern")
        ("series-pattern", po::value<std::string>(), "Case-insensitive regex for --choose-lng (default LNG)")
        ("channel", po::value<int>(), "1-based channel spots are counted on (default 2)")
        ("roi-source", po::value<std::string>()->default_value("interactive"),
            "'interactive' to draw cells, or a directory of <series>_RoiSet.zip archives")
        ("threads", po::value<int>(), "Worker threads for per-cell measurement, 0 = all cores")
        ("exclude-edge-maxima", po::bool_switch(), "Drop maxima whose region touches the image border")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error or critical")
        ("log-file", po::value<std::string>(), "Also write the log to this file");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            std::cout << "\nExamples:\n"
                      << "  bc_count_spots -i /data/plate1 -o /data/plate1_results\n"
                      << "  bc_count_spots -i in -o out --choose-lng --channel 2\n"
                      << "  bc_count_spots -i in -o out2 --roi-source out   # re-count with saved ROIs\n";
            return kExitOk;
        }
        if (vm.count("version")) {
            std::cout << ProjectInfo::NameAndVersion() << " (" << ProjectInfo::RepositoryShortHash() << ")\n";
            return kExitOk;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return kExitUsage;
    }

    bc::PipelineParams params;
    try {
        if (vm.count("config"))
            params = bc::pipeline::loadPipelineParams(vm["config"].as<std::string>());

        if (vm.count("maxima-tolerance")) params.maxima_tolerance = vm["maxima-tolerance"].as<double>();
        if (vm.count("top-hat-radius")) params.top_hat_radius = vm["top-hat-radius"].as<double>();
        if (vm.count("median-radius")) params.median_radius = vm["median-radius"].as<double>();
        if (vm["choose-lng"].as<bool>()) params.choose_lng = true;
        if (vm.count("series-pattern")) params.series_pattern = vm["series-pattern"].as<std::string>();
        if (vm.count("channel")) params.channel = vm["channel"].as<int>();
        if (vm.count("threads")) params.threads = vm["threads"].as<int>();
        if (vm["exclude-edge-maxima"].as<bool>()) params.exclude_edge_maxima = true;
        if (vm.count("log-level")) params.log_level = vm["log-level"].as<std::string>();

        bc::pipeline::validate(params);
        SetLogLevel(params.log_level);
        if (vm.count("log-file"))
            AddLogFile(vm["log-file"].as<std::string>());
    } catch (const bc::IOError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    }

    fs::path inputRoot = vm.count("input") ? vm["input"].as<std::string>()
                                           : promptDirectory("Choose the input directory");
    fs::path outputRoot = vm.count("output") ? vm["output"].as<std::string>()
                                             : promptDirectory("Choose the output directory");
    if (inputRoot.empty() || outputRoot.empty()) {
        std::cerr << "Error: both an input and an output directory are required\n";
        return kExitUsage;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::unique_ptr<bc::RoiProvider> provider;
    const std::string roiSource = vm["roi-source"].as<std::string>();
    if (roiSource == "interactive")
        provider = std::make_unique<bc::ui::HighguiRoiProvider>(&g_cancel);
    else
        provider = std::make_unique<bc::RoiSetFileProvider>(roiSource);

    Logger()->info("{} starting: input {}, output {}", ProjectInfo::NameAndVersion(),
                   inputRoot.string(), outputRoot.string());

    try {
        bc::Pipeline pipeline(params, inputRoot, outputRoot, *provider, &g_cancel);
        const bc::RunSummary& summary = pipeline.run();

        nlohmann::json runConfig = bc::pipeline::toJson(params);
        runConfig["input"] = inputRoot.string();
        runConfig["roi_source"] = roiSource;
        runConfig["version"] = ProjectInfo::VersionString();
        runConfig["repository_hash"] = ProjectInfo::RepositoryHash();
        bc::json::save_json_file(outputRoot / "run_config.json", runConfig);

        std::cout << "\n";
        for (const auto& line : bc::describeSummary(summary))
            std::cout << line << "\n";
        std::cout << "Results written to " << (outputRoot / bc::ReportWriter::kResultsFile).string() << "\n";

        if (summary.cancelled)
            return kExitCancelled;
        return summary.hasFailures() ? kExitPartial : kExitOk;
    } catch (const bc::IOError& e) {
        Logger()->critical("{}", e.what());
        return kExitIo;
    } catch (const std::runtime_error& e) {
        Logger()->critical("{}", e.what());
        return kExitUsage;
    }
}
