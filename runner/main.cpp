#include "cmds.h"

#include "agency/types.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "agency_cli <serve|process|run|resume|snapshots|version> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "process") return cmd_process(argc, argv);
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "resume") return cmd_resume(argc, argv);
    if (cmd == "snapshots") return cmd_snapshots(argc, argv);
    if (cmd == "version" || cmd == "--version") {
        std::cout << "agency " << agency::kAgencyVersion << "\n";
        return 0;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
