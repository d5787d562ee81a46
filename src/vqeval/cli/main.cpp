#include "modes.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - compare : evaluate candidates against a reference locally.
    - probe   : show container metadata.
    - serve   : run the gRPC evaluation service.
    - remote  : evaluate through a running service.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  vqeval-cli compare --ref=REF --cand=C1[,C2...] [--labels=L1[,L2...]]\n"
        << "                     [--samples=50|--exhaustive] [--size=640x360|native] [--window=7]\n"
        << "                     [--threads=0] [--verbose]\n"
        << "  vqeval-cli probe   --file=PATH\n"
        << "  vqeval-cli serve   [--port=50061] [--max-concurrent=2] [--threads=0]\n"
        << "  vqeval-cli remote  --server=HOST:PORT --ref=REF --cand=CAND [--stream]\n"
        << "                     [--samples=N|--exhaustive] [--size=WxH|native] [--window=N]\n"
        << "     REF/CAND: .mp4, .avi, .vqr recording, or a folder of images.\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if      (mode == "compare") return run_compare(argc, argv);
    else if (mode == "probe")   return run_probe  (argc, argv);
    else if (mode == "serve")   return run_serve  (argc, argv);
    else if (mode == "remote")  return run_remote (argc, argv);
    else if (mode == "help" || mode == "--help") { print_usage(); return 0; }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
