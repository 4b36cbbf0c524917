#include "commands.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "evogate_cli <analyze|evaluate|audit|review|pending|stats|history|serve> ...\n";
        std::cerr << "env: EVOGATE_PROFILE=dev|prod, EVOGATE_BACKEND=subprocess|restricted|container\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "analyze") return cmd_analyze(argc, argv);
    if (cmd == "evaluate") return cmd_evaluate(argc, argv);
    if (cmd == "audit") return cmd_audit(argc, argv);
    if (cmd == "review") return cmd_review(argc, argv);
    if (cmd == "pending") return cmd_pending(argc, argv);
    if (cmd == "stats") return cmd_stats(argc, argv);
    if (cmd == "history") return cmd_history(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
