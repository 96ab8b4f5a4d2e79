#include <toml++/toml.h>
#include <cstdio>
#include <iostream>
#include <string>
#include "matchtrack/config.h"
#include "matchtrack/core/errors.h"
#include "matchtrack/detect/detector.h"
#include "matchtrack/io/dataset_io.h"
#include "matchtrack/pipeline/match_analyzer.h"


static void print_usage(const char *argv0) {
    std::cerr << "usage: " << argv0 << " <dataset.(yml|json)> <result.(yml|json)> [config.toml]" << std::endl;
}


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string dataset_path = argv[1];
    const std::string result_path = argv[2];
    const std::string config_path = argc == 4 ? argv[3] : "config.toml";

    std::cout << "[PIPE] matchtrack " << MATCHTRACK_VERSION << std::endl;

    // получаем конфигурацию из config.toml
    matchtrack::AppConfig cfg;
    try {
        toml::table tbl = toml::parse_file(config_path);
        if (!matchtrack::load_app_config(tbl, cfg)) {
            std::cerr << "[CFG] some sections failed to load, defaults kept for them" << std::endl;
        }
    } catch (const toml::parse_error &e) {
        std::cerr << "config " << config_path << " parse failed  " << e.description()
                  << " (" << e.source().begin << ")" << std::endl;
        return 1;
    }
    matchtrack::finalize_app_config(cfg);
    matchtrack::print_app_config(cfg);

    try {
        matchtrack::io::Dataset ds = matchtrack::io::read_dataset(dataset_path);

        matchtrack::detect::PlayerDetector players = matchtrack::detect::PlaceholderPlayerDetector{};
        matchtrack::detect::BallDetector ball = matchtrack::detect::PlaceholderBallDetector{};
        if (cfg.detector_kind == matchtrack::detect::DetectorKind::Recorded) {
            players = matchtrack::detect::RecordedPlayerDetector(ds.players);
            ball = matchtrack::detect::RecordedBallDetector(ds.ball);
        }

        matchtrack::pipeline::MatchAnalyzer analyzer(cfg);
        const matchtrack::pipeline::MatchOutput out = analyzer.run(ds.input, players, ball);

        matchtrack::io::write_result(result_path, out);
        std::cout << "[PIPE] result written to " << result_path << std::endl;
    } catch (const matchtrack::AnalysisError &e) {
        std::cerr << "analysis failed  code=" << matchtrack::to_string(e.code())
                  << " retryable=" << (e.retryable() ? "yes" : "no")
                  << "  " << e.what() << std::endl;
        return 2;
    }
    return 0;
}
