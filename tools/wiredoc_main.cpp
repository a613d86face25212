// wiredoc_main.cpp - Build wiring documentation packs from plan PDFs and zone tables
//
// Usage:
//   wiredoc build <config.yaml> [output.pdf] [options]
//   wiredoc check <config.yaml>
//
// See print_usage() for options and exit codes.

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "wiredoc/build_error.h"
#include "wiredoc/config.h"
#include "wiredoc/pack_assembler.h"
#include "wiredoc/source_resolver.h"
#include "wiredoc/text_util.h"
#include "wiredoc/zone_data.h"

namespace fs = std::filesystem;
using namespace WireDoc;

static std::atomic<bool> g_cancel{false};

static void handle_sigint(int) {
    g_cancel.store(true);
}

// ============================================================================
// Usage and reporting
// ============================================================================

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << prog << " build <config.yaml> [output.pdf] [options]\n";
    std::cerr << "  " << prog << " check <config.yaml>\n";
    std::cerr << "\nBuild Options:\n";
    std::cerr << "  --set-timestamp <ts>               Fixed build time, \"YYYY-MM-DD HH:MM[:SS]\"\n";
    std::cerr << "                                     (footers and PDF dates; output is reproducible)\n";
    std::cerr << "  --workers <n>                      Rooms processed in parallel (0 = all cores)\n";
    std::cerr << "  --debug-retain-working-directory   Keep per-room data and plan PDFs\n";
    std::cerr << "  -v, --verbose                      Per-page progress\n";
    std::cerr << "\nOutput defaults to <config name>.pdf in the current directory.\n";
    std::cerr << "\nExit Codes:\n";
    std::cerr << "  0  - Success\n";
    std::cerr << "  1  - Invalid arguments\n";
    std::cerr << "  2  - Configuration error\n";
    std::cerr << "  3  - Geometry error\n";
    std::cerr << "  4  - Source document error\n";
    std::cerr << "  5  - Assembly error\n";
    std::cerr << "  6  - Write error\n";
    std::cerr << "  7  - Cancelled\n";
    std::cerr << "  10 - Unknown error\n";
}

static void print_build_error(const BuildError& e) {
    std::cerr << "\n";
    std::cerr << "=============================================================================\n";
    std::cerr << "ERROR: " << kind_name(e.kind()) << "\n";
    std::cerr << "=============================================================================\n";
    for (const auto& i : e.issues()) {
        std::cerr << "  - " << i.describe() << "\n";
    }
    std::cerr << "=============================================================================\n";
    std::cerr << std::endl;
}

// ============================================================================
// Loading
// ============================================================================

struct LoadedInputs {
    PackConfig config;
    TabTable tabs;
    CropTable crops;
    std::unique_ptr<CsvZoneDataProvider> zones;
    std::unique_ptr<PatternSourceResolver> resolver;
};

// Tables are loaded independently so that one run reports problems in all of them
static LoadedInputs load_inputs(const std::string& config_path) {
    LoadedInputs in;
    in.config = load_pack_config(config_path);

    std::vector<BuildIssue> issues;
    bool tabs_ok = false;
    try {
        in.tabs = load_tab_table(in.config.resolvePath(in.config.tabs_file));
        tabs_ok = true;
    } catch (const BuildError& e) {
        issues.insert(issues.end(), e.issues().begin(), e.issues().end());
    }
    try {
        in.crops = load_crop_table(in.config.resolvePath(in.config.crops_file));
    } catch (const BuildError& e) {
        issues.insert(issues.end(), e.issues().begin(), e.issues().end());
    }
    if (tabs_ok) {
        try {
            in.zones.reset(new CsvZoneDataProvider(
                CsvZoneDataProvider::load(in.config.resolvePath(in.config.csv_data_directory), in.tabs)));
        } catch (const BuildError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
        }
    }
    throw_if_any(std::move(issues));

    in.resolver.reset(new PatternSourceResolver(in.config.resolvePath(in.config.plan_pdfs_directory),
                                                in.config.pdf_filename_pattern));

    std::cout << "INFO: Loaded " << config_path << " (" << in.config.rooms.size() << " room(s), "
              << in.tabs.tabs().size() << " tab(s))" << std::endl;
    return in;
}

static std::string make_temp_directory() {
    std::string templ = (fs::temp_directory_path() / "wiredoc_XXXXXX").string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw BuildError(issue(ErrorCode::WRITE_FAILED).at_path(templ)
            .because(std::string("cannot create temporary directory: ") + std::strerror(errno)));
    }
    return std::string(buf.data());
}

// ============================================================================
// Commands
// ============================================================================

static int run_check(const std::string& config_path) {
    LoadedInputs in = load_inputs(config_path);

    BuildOptions options;
    options.title = in.config.title;
    options.cancel = &g_cancel;
    PackAssembler assembler(in.config.rooms, in.crops, in.tabs, *in.resolver, *in.zones, options);
    assembler.check();

    std::cout << "\nConfiguration OK: " << config_path << std::endl;
    return EC_SUCCESS;
}

static int run_build(const std::string& config_path, std::string output_path, BuildOptions options,
                     bool workers_set, bool retain) {
    LoadedInputs in = load_inputs(config_path);

    if (output_path.empty()) {
        output_path = fs::path(config_path).stem().string() + ".pdf";
    }

    options.title = in.config.title;
    options.cancel = &g_cancel;
    if (!workers_set) options.workers = in.config.workers;
    if (retain) {
        options.retain_directory = in.config.working_directory.empty()
            ? make_temp_directory()
            : in.config.resolvePath(in.config.working_directory);
    }

    std::unique_ptr<DocumentationPack> pack =
        build_pack(in.config.rooms, in.crops, in.tabs, *in.resolver, *in.zones, options);

    std::cout << "\n7. Writing " << output_path << "..." << std::endl;
    pack->write(output_path, &g_cancel);

    if (retain) {
        std::cout << "INFO: Working directory retained for debugging: " << options.retain_directory << std::endl;
    }

    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "SUCCESS\n";
    std::cout << "=============================================================================\n";
    std::cout << "Output file:  " << output_path << "\n";
    std::cout << "Rooms:        " << pack->blocks().size() << "\n";
    std::cout << "Pages:        " << pack->pageCount() << "\n";
    std::cout << "Timestamp:    " << pack->timestamp().display() << "\n";
    std::cout << "=============================================================================\n";
    std::cout << std::endl;
    return EC_SUCCESS;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc == 2 && (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return EC_SUCCESS;
    }
    if (argc < 3) {
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }

    std::string command = argv[1];
    std::string config_path = argv[2];
    std::string output_path;
    BuildOptions options;
    bool workers_set = false;
    bool retain = false;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--set-timestamp") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --set-timestamp requires an argument\n";
                return EC_INVALID_ARGS;
            }
            options.timestamp = argv[++i];
        } else if (arg == "--workers") {
            int n = 0;
            if (i + 1 >= argc) {
                std::cerr << "Error: --workers requires an argument\n";
                return EC_INVALID_ARGS;
            }
            if (!parse_int(argv[++i], n) || n < 0) {
                std::cerr << "Error: --workers must be a non-negative integer\n";
                return EC_INVALID_ARGS;
            }
            options.workers = static_cast<unsigned>(n);
            workers_set = true;
        } else if (arg == "--debug-retain-working-directory") {
            retain = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return EC_INVALID_ARGS;
        } else if (output_path.empty() && command == "build") {
            output_path = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            print_usage(argv[0]);
            return EC_INVALID_ARGS;
        }
    }

    if (command != "build" && command != "check") {
        std::cerr << "Error: Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }

    std::signal(SIGINT, handle_sigint);

    try {
        if (command == "check") return run_check(config_path);
        return run_build(config_path, output_path, options, workers_set, retain);
    } catch (const BuildError& e) {
        print_build_error(e);
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EC_UNKNOWN_ERROR;
    }
}
