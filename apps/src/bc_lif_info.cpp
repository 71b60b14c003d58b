// bc_lif_info: list the image series of LIF containers

#include <boost/program_options.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "bc/core/Version.hpp"
#include "bc/core/lif/LifReader.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/FileDiscovery.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/pipeline/SeriesFilter.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char* argv[])
{
    po::options_description desc("bc_lif_info - list LIF series\n\nUsage: bc_lif_info [options] <file-or-dir>...");
    desc.add_options()
        ("help,h", "Show this help message")
        ("input,i", po::value<std::vector<std::string>>()->composing(), "LIF file or directory searched recursively")
        ("series-pattern", po::value<std::string>()->default_value("LNG"),
            "Regex reported in the 'match' column (case-insensitive)")
        ("log-level", po::value<std::string>()->default_value("warn"), "Log level");

    po::positional_options_description pos;
    pos.add("input", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        if (vm.count("help") || !vm.count("input")) {
            std::cout << ProjectInfo::NameAndVersion() << "\n" << desc << "\n";
            return vm.count("help") ? 0 : 1;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return 1;
    }

    if (!SetLogLevel(vm["log-level"].as<std::string>())) {
        std::cerr << "Error: unknown log level " << vm["log-level"].as<std::string>() << "\n";
        return 1;
    }

    std::unique_ptr<bc::SeriesFilter> filter;
    try {
        filter = std::make_unique<bc::SeriesFilter>(true, vm["series-pattern"].as<std::string>());
    } catch (const std::regex_error& e) {
        std::cerr << "Error: --series-pattern does not compile: " << e.what() << "\n";
        return 1;
    }

    std::vector<fs::path> files;
    for (const auto& in : vm["input"].as<std::vector<std::string>>()) {
        try {
            std::error_code ec;
            if (fs::is_directory(in, ec)) {
                for (auto& f : bc::discoverContainers(in))
                    files.push_back(f);
            } else {
                files.emplace_back(in);
            }
        } catch (const bc::IOError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
    }

    int failed = 0;
    for (const auto& file : files) {
        try {
            bc::lif::LifReader reader(file);
            std::cout << file.string() << "  (LIF v" << reader.version() << ", "
                      << reader.seriesCount() << " series)\n";
            for (size_t i = 0; i < reader.seriesCount(); ++i) {
                const bc::SeriesInfo& s = reader.info(i);
                std::string luts;
                for (auto lut : s.luts)
                    luts += (luts.empty() ? "" : ",") + bc::lutName(lut);
                std::cout << "  " << std::setw(3) << i << "  " << std::left << std::setw(32) << s.name
                          << std::right << "  " << s.sizeX << "x" << s.sizeY << "x" << s.sizeZ
                          << "  C=" << s.sizeC << "  " << s.bitsPerSample << "-bit  " << luts
                          << (filter->accepts(s.name) ? "  match" : "") << "\n";
            }
        } catch (const bc::FormatError& e) {
            std::cerr << file.string() << ": " << e.what() << "\n";
            ++failed;
        } catch (const bc::IOError& e) {
            std::cerr << file.string() << ": " << e.what() << "\n";
            ++failed;
        }
    }
    return failed ? 3 : 0;
}
