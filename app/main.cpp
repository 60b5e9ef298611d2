#include "commands/check.hpp"
#include "commands/extract.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  entity-extractor extract [args]\n"
        << "  entity-extractor check <collection.json> [more.json ...]\n"
        << "  entity-extractor merge <a.json> [b.json ...] --out <merged.json>\n"
        << "  entity-extractor help\n";
    return 1;
}

static int print_extract_help() {
    std::cerr
        << "usage:\n"
        << "  entity-extractor extract --config <path> (--text <file> | --input <str>) [options]\n"
        << "\n"
        << "common:\n"
        << "  --config <path>              (required) extractor configuration json\n"
        << "  --text <file>                text to extract from\n"
        << "  --input <str>                inline text, used when --text is absent\n"
        << "  --source_id <str>            tag recorded on the collection and its observations\n"
        << "  --out <path>                 optional: write the merged collection as json\n"
        << "\n"
        << "capabilities:\n"
        << "  --replay <dir>               replay <dir>/<source_id>.json as an extra capability\n"
        << "  --parallel                   run capabilities concurrently\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        print_usage();
        return 0;
    }

    if (cmd == "extract" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_extract_help();

    if (cmd == "extract") return cmd_extract(argc - 1, argv + 1);
    if (cmd == "check")   return cmd_check(argc - 1, argv + 1);
    if (cmd == "merge")   return cmd_merge(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
