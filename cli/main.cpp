#include "qsoflux/awards.hpp"
#include "qsoflux/config.hpp"
#include "qsoflux/import_pipeline.hpp"
#include "qsoflux/log_io.hpp"
#include "qsoflux/record_store.hpp"

#include <exception>
#include <iostream>
#include <string>

using namespace qsoflux;

namespace {

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  qsoflux_cli import <log.adi[.gz|.xz]>\n"
              << "  qsoflux_cli export <in.adi> <out.adi[.gz]>\n"
              << "  qsoflux_cli summary <log.adi> [--band B] [--mode M]\n"
              << "  qsoflux_cli suggest <log.adi>\n"
              << "Settings are read from .env and QSOFLUX_* environment variables.\n";
}

ImportResult ImportFile(const Config& cfg, const std::string& path) {
    const std::string text = ReadLogFile(path);
    ImportPipeline pipeline(cfg.Pipeline());
    auto result = pipeline.Run(text);
    std::cerr << "decoded " << path << ": accepted=" << result.records.size() << " skipped=" << result.num_skipped
              << " backend=" << (result.parallel ? BackendKindName(cfg.backend) : "serial")
              << (result.fell_back_serial ? " (fallback)" : "") << "\n";
    return result;
}

void PrintSummary(const AwardsSummary& s) {
    std::cout << "total_qsos " << s.total_qsos << "\n"
              << "unique_countries " << s.UniqueCountries() << "\n"
              << "unique_grids " << s.UniqueGrids() << "\n"
              << "unique_calls " << s.UniqueCalls() << "\n"
              << "unique_bands " << s.UniqueBands() << "\n"
              << "unique_modes " << s.UniqueModes() << "\n";
    for (const auto& [band, count] : s.GridsPerBand()) {
        std::cout << "grids_per_band " << (band.empty() ? "unknown" : band) << " " << count << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }

    const Config cfg = LoadConfig();
    const std::string cmd = argv[1];

    try {
        if (cmd == "import") {
            auto result = ImportFile(cfg, argv[2]);
            MemoryRecordStore store;
            std::cout << "stored " << store.InsertBatch(result.records) << " of " << result.num_chunks << "\n";
            return 0;
        }

        if (cmd == "export") {
            if (argc < 4) {
                PrintUsage();
                return 1;
            }
            auto result = ImportFile(cfg, argv[2]);
            MemoryRecordStore store;
            store.InsertBatch(result.records);
            auto cursor = store.Iterate();
            auto written = WriteLogFile(argv[3], *cursor, cfg.Encoder());
            std::cout << "exported " << written << " records to " << argv[3] << "\n";
            return 0;
        }

        if (cmd == "summary") {
            std::string band;
            std::string mode;
            for (int i = 3; i + 1 < argc; i += 2) {
                std::string flag = argv[i];
                if (flag == "--band") {
                    band = argv[i + 1];
                } else if (flag == "--mode") {
                    mode = argv[i + 1];
                } else {
                    PrintUsage();
                    return 1;
                }
            }
            auto result = ImportFile(cfg, argv[2]);
            auto filtered = FilterQsos(result.records, band, mode);
            PrintSummary(ComputeSummaryParallel(filtered, cfg.Summary()));
            return 0;
        }

        if (cmd == "suggest") {
            auto result = ImportFile(cfg, argv[2]);
            auto summary = ComputeSummaryParallel(result.records, cfg.Summary());
            auto suggestions = SuggestAwards(summary, LoadAwardThresholds(cfg.awards_config));
            if (suggestions.empty()) {
                std::cout << "no award suggestions yet\n";
            }
            for (const auto& line : suggestions) {
                std::cout << line << "\n";
            }
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    PrintUsage();
    return 1;
}
