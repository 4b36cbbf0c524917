#include "commands.h"
#include "runner_utils.h"

#include "evogate/serialization.h"
#include "evogate/util.h"

#include <iostream>

using namespace evogate;

int cmd_analyze(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: evogate_cli analyze <candidate.py>\n";
        return 2;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(argv[2], ec)) {
        std::cerr << "cannot read " << argv[2] << "\n";
        return 2;
    }
    StaticAnalyzer analyzer;
    StaticAnalysisReport r = analyzer.analyze(slurp_file(argv[2]));
    print_json(report_to_json(r));
    return r.risk == RiskAssessment::BLOCKED ? 1 : 0;
}

// Usage: evogate_cli evaluate <request.json> [--wall-ms N] [--wait-ms N]
// Runs one request through the whole pipeline and prints the final result.
int cmd_evaluate(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2);
    if (args.pos.empty()) {
        std::cerr << "usage: evogate_cli evaluate <request.json> [--wall-ms N] [--wait-ms N]\n";
        return 2;
    }

    std::filesystem::path req_path = std::filesystem::absolute(args.pos[0]);
    std::string body = slurp_file(req_path);
    if (body.empty()) {
        std::cerr << "cannot read " << req_path.string() << "\n";
        return 2;
    }
    EvolutionRequest req;
    std::string err;
    if (!parse_request_file(body, req_path.parent_path(), &req, &err)) {
        std::cerr << "bad request file: " << err << "\n";
        return 2;
    }

    Pipeline p;
    err = open_pipeline(&p, args.flag_int("wall-ms", 0));
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }
    err = p.controller->start();
    if (!err.empty()) std::cerr << "[controller] " << err << "\n";

    const std::string id = p.controller->submit(req);
    auto res = p.controller->wait_for(id, args.flag_int("wait-ms", -1));
    p.controller->stop();

    if (!res) {
        std::cerr << "no result for " << id << " within the wait limit\n";
        return 5;
    }
    print_json(evolution_result_to_json(*res));
    return exit_code_for(res->state);
}
