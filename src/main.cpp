#include "config.h"
#include "container_runtime.h"
#include "engine.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace runbox;

namespace {

constexpr int EXIT_OTHER_STATUS = 1;
constexpr int EXIT_REJECTED = 2;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --language <id> --source <path|-> [options]\n"
              << "       " << program << " --list-languages [--config <file>]\n"
              << "       " << program << " --check-runtime [--config <file>] [--runtime docker|local]\n"
              << "\n"
              << "Options:\n"
              << "  --session <name>     Workspace to run in (default: \"default\")\n"
              << "  --file <name>        File name inside code/ (generated when absent)\n"
              << "  --existing           Run code/<file> as already stored in the workspace\n"
              << "  --timeout <seconds>  Wall-clock limit (policy default when absent)\n"
              << "  --memory <bytes>     Memory ceiling\n"
              << "  --cpus <cores>       CPU share\n"
              << "  --verify <constant>  Check the printed result against pi, e, sqrt2, ...\n"
              << "  --config <file>      JSON engine configuration\n"
              << "  --runtime <kind>     Override the configured runtime (docker or local)\n"
              << "\n"
              << "Prints the execution result as JSON on stdout. Exit status: 0 completed,\n"
              << "1 any other outcome, 2 rejected request or bad configuration.\n";
}

bool read_source(const std::string& path, std::string& out) {
    if (path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string runtime_override;
    std::string source_path;
    bool list_languages = false;
    bool check_runtime = false;
    SubmitRequest request;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--language" && has_value) {
                request.language = argv[++i];
            } else if (arg == "--session" && has_value) {
                request.session = argv[++i];
            } else if (arg == "--file" && has_value) {
                request.file_name = argv[++i];
            } else if (arg == "--source" && has_value) {
                source_path = argv[++i];
            } else if (arg == "--existing") {
                request.use_existing_file = true;
            } else if (arg == "--timeout" && has_value) {
                request.timeout_seconds = std::stoi(argv[++i]);
            } else if (arg == "--memory" && has_value) {
                request.memory_limit_bytes = std::stoull(argv[++i]);
            } else if (arg == "--cpus" && has_value) {
                request.cpu_limit = std::stod(argv[++i]);
            } else if (arg == "--verify" && has_value) {
                request.verify_constant = argv[++i];
            } else if (arg == "--config" && has_value) {
                config_path = argv[++i];
            } else if (arg == "--runtime" && has_value) {
                runtime_override = argv[++i];
            } else if (arg == "--list-languages") {
                list_languages = true;
            } else if (arg == "--check-runtime") {
                check_runtime = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_REJECTED;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid numeric option value" << std::endl;
        return EXIT_REJECTED;
    }

    EngineConfig config;
    try {
        if (!config_path.empty()) {
            config = load_engine_config(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_REJECTED;
    }
    if (runtime_override == "docker") {
        config.runtime.kind = RuntimeKind::Docker;
    } else if (runtime_override == "local") {
        config.runtime.kind = RuntimeKind::Local;
    } else if (!runtime_override.empty()) {
        std::cerr << "Unknown runtime: " << runtime_override << std::endl;
        return EXIT_REJECTED;
    }

    if (list_languages) {
        for (const auto& id : config.languages.ids()) {
            auto language = config.languages.resolve(id);
            std::cout << id << "\t" << language->runtime_image << "\t."
                      << language->file_extension << std::endl;
        }
        return 0;
    }

    // Logs go to stderr so stdout carries only the JSON result
    std::ostream result_out(std::cout.rdbuf());
    std::cout.rdbuf(std::cerr.rdbuf());
    struct RestoreStdout {
        std::streambuf* buffer;
        ~RestoreStdout() { std::cout.rdbuf(buffer); }
    } restore{result_out.rdbuf()};

    if (check_runtime) {
        try {
            auto runtime = make_runtime(config.runtime);
            bool up = runtime->available();
            result_out << runtime->name() << (up ? " available" : " unavailable") << std::endl;
            return up ? 0 : EXIT_OTHER_STATUS;
        } catch (const std::exception& e) {
            std::cerr << "Runtime setup failed: " << e.what() << std::endl;
            return EXIT_OTHER_STATUS;
        }
    }

    if (request.language.empty() || (source_path.empty() && !request.use_existing_file)) {
        print_usage(argv[0]);
        return EXIT_REJECTED;
    }
    if (!source_path.empty() && !read_source(source_path, request.source)) {
        std::cerr << "Cannot read source: " << source_path << std::endl;
        return EXIT_REJECTED;
    }

    std::unique_ptr<ExecutionEngine> engine;
    try {
        engine = std::make_unique<ExecutionEngine>(config);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_REJECTED;
    } catch (const std::exception& e) {
        std::cerr << "Engine setup failed: " << e.what() << std::endl;
        return EXIT_OTHER_STATUS;
    }

    Result<ExecutionResult> outcome = engine->submit(request);
    if (!outcome) {
        std::cerr << error_kind_to_string(outcome.error().kind) << ": "
                  << outcome.error().message << std::endl;
        return EXIT_REJECTED;
    }

    result_out << outcome->to_json() << std::endl;
    return outcome->status == ExecutionStatus::Completed ? 0 : EXIT_OTHER_STATUS;
}
