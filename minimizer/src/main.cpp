#include "app/BatchRunner.hpp"
#include "monitor/Log.hpp"
#include "utils/Config.hpp"

#include <signal.h>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--config=PATH] [--input-har=PATH] [--output-har=PATH]"
                 " [--report=PATH] [--log-level=debug|info|warn|error]\n";
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    std::string configPath = "config/minimizer.json";
    std::optional<std::string> inputHar;
    std::optional<std::string> outputHar;
    std::optional<std::string> reportPath;

    // Read CLI args: --key=value
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            configPath = arg.substr(9);
        } else if (arg.rfind("--input-har=", 0) == 0) {
            inputHar = arg.substr(12);
        } else if (arg.rfind("--output-har=", 0) == 0) {
            outputHar = arg.substr(13);
        } else if (arg.rfind("--report=", 0) == 0) {
            reportPath = arg.substr(9);
        } else if (arg.rfind("--log-level=", 0) == 0) {
            auto level = Log::parseLevel(arg.substr(12));
            if (!level) {
                std::cerr << "Unknown log level: " << arg.substr(12) << "\n";
                usage(argv[0]);
                return 2;
            }
            Log::setLevel(*level);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    try {
        Config cfg = Config::load(configPath);
        if (inputHar) cfg.inputHar = *inputHar;
        if (outputHar) cfg.outputHar = *outputHar;
        if (reportPath) cfg.reportPath = *reportPath;

        BatchRunner runner(std::move(cfg));
        runner.run();
    } catch (const std::exception& e) {
        LOGX(LogLevel::Error, "MAIN", e.what());
        return 1;
    }

    return 0;
}

//cmake -S . -B build
//cmake --build build
//./build/har_minimizer --config=config/minimizer.json
