//
// Lambda Runner Tool
// Applies a lambda file to a JSON batch of signals through the same API the
// service exposes, and prints the response body. For offline debugging.
//

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>

#include <signal_lambda/api/lambda_api.h>
#include <signal_lambda/runtime/availability.h>
#include <signal_lambda/runtime/iorchestrator.h>

namespace fs = std::filesystem;

struct RunnerConfig {
    std::string code_file;
    std::string signals_file;
    std::string output_file;
    std::string log_level = "warn";
    bool validate_only = false;
    bool help = false;
};

struct ApplyBody {
    std::string code;
    glz::raw_json signals;
};

struct ValidateBody {
    std::string code;
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " --code FILE [options]\n"
              << "Options:\n"
              << "  --code FILE          Lambda source file (required)\n"
              << "  --signals FILE       JSON array of signal objects (default: [])\n"
              << "  --validate-only      Only run the grammar validator\n"
              << "  --output FILE        Write the response body to FILE instead of stdout\n"
              << "  --log-level LEVEL    spdlog level (default: warn)\n"
              << "  --help               Show this message\n"
              << "Exit status: 0 on success, 1 when the lambda is rejected or fails, 2 on usage errors\n";
}

RunnerConfig ParseArgs(int argc, char* argv[]) {
    RunnerConfig config;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.help = true;
        } else if (arg == "--code" && i + 1 < argc) {
            config.code_file = argv[++i];
        } else if (arg == "--signals" && i + 1 < argc) {
            config.signals_file = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--validate-only") {
            config.validate_only = true;
        } else {
            throw std::invalid_argument("Unknown or incomplete argument: " + arg);
        }
    }
    if (!config.help && config.code_file.empty()) {
        throw std::invalid_argument("--code is required");
    }
    return config;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

template <typename T>
std::string WriteBody(const T& body) {
    auto json = glz::write_json(body);
    if (!json) {
        throw std::runtime_error("Failed to encode request: " + glz::format_error(json.error()));
    }
    return std::move(*json);
}

int main(int argc, char* argv[]) {
    RunnerConfig config;
    try {
        config = ParseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        PrintUsage(argv[0]);
        return 2;
    }
    if (config.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    signal_lambda::api::ApiResponse response;
    try {
        auto orchestrator = signal_lambda::runtime::CreateLambdaOrchestrator(signal_lambda::runtime::ProbeSandbox(true));
        signal_lambda::api::LambdaApi api(std::move(orchestrator));

        std::string code = ReadFile(config.code_file);
        if (config.validate_only) {
            response = api.ValidateLambda(WriteBody(ValidateBody{.code = std::move(code)}));
        } else {
            std::string signals = config.signals_file.empty() ? "[]" : ReadFile(config.signals_file);
            response = api.ApplyLambda(WriteBody(ApplyBody{.code = std::move(code), .signals = {signals}}));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (config.output_file.empty()) {
        std::cout << response.body << "\n";
    } else {
        std::ofstream out(config.output_file);
        out << response.body << "\n";
        if (!out) {
            std::cerr << "Failed to write " << config.output_file << "\n";
            return 2;
        }
    }

    if (response.status != 200) {
        return 1;
    }
    if (config.validate_only && response.body.find("\"valid\":true") == std::string::npos) {
        return 1;
    }
    return 0;
}
