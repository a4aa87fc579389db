/**
 * Scribe 批量转写命令行
 *
 * Usage:
 *   ./scribe [options] media_file [media_file ...]
 *
 * Examples:
 *   ./scribe a.wav b.wav
 *   ./scribe -m base.en -osrt -otxt a.wav
 *   ./scribe --beam-size 5 --language de interview.wav
 */

#include <iostream>
#include <memory>
#include <string>

#include "scribe/backends/backend_factory.hpp"
#include "scribe/batch_runner.hpp"
#include "scribe/cancellation.hpp"
#include "scribe/cli_config.hpp"
#include "scribe/engine.hpp"
#include "scribe/params.hpp"
#include "scribe/scribe.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitFileFailed = 2;
constexpr int kExitInterrupted = 130;

void printBanner() {
    std::cout << std::endl;
    std::cout << "Scribe" << std::endl;
    std::cout << "Batch transcription of media files, based on whisper.cpp" << std::endl;
    std::cout << "Version: " << scribe::getVersionString() << std::endl;
    std::cout << "====================================================" << std::endl;
    std::cout << std::endl;
}

int run(const scribe::CliConfig& config) {
    std::cout << "[Cli] Running with model `" << config.model << "`" << std::endl;

    auto params = scribe::ParamResolver::resolve(config.engine_args);
    std::cout << "[Cli] Running with params" << std::endl << params.toString() << std::endl;

    scribe::Engine engine(scribe::EngineBackendFactory::create(scribe::BackendType::WHISPER));
    auto err = engine.initialize(config.model, params);
    if (!err.isOk()) {
        std::cerr << "[Cli] Failed to initialize engine: " << err.describe() << std::endl;
        return kExitConfig;
    }

    auto effective = engine.getParams();
    const scribe::ParamValue* n_threads = effective.find("n_threads");
    std::cout << "[Cli] System info:" << std::endl
              << "  n_threads = " << (n_threads ? scribe::paramValueToString(*n_threads) : "-")
              << std::endl
              << "  processors = " << config.processors << std::endl
              << "  other = " << engine.systemInfo() << std::endl;

    scribe::installInterruptHandler();

    scribe::BatchRunner runner(engine, config.outputs, config.processors,
        &scribe::interruptToken());
    auto result = runner.run(config.media_files);

    if (result.interrupted) {
        return kExitInterrupted;
    }
    if (result.failed() > 0) {
        std::cerr << "[Cli] " << result.failed() << " of " << result.files.size()
                  << " files failed" << std::endl;
        return kExitFileFailed;
    }
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    printBanner();

    const std::string program = argc > 0 ? argv[0] : "scribe";

    scribe::CliParser parser;
    scribe::CliConfig config;

    auto err = parser.parse(argc, argv, config);
    if (!err.isOk()) {
        std::cerr << program << ": error: " << err.describe() << std::endl;
        std::cerr << "Try '" << program << " --help' for more information." << std::endl;
        return kExitConfig;
    }

    if (config.show_help) {
        std::cout << parser.usage(program);
        return kExitOk;
    }
    if (config.show_version) {
        std::cout << program << " " << scribe::getVersionString() << std::endl;
        return kExitOk;
    }

    err = scribe::CliConfigValidator::validate(config);
    if (!err.isOk()) {
        std::cerr << program << ": error: " << err.describe() << std::endl;
        std::cerr << parser.usage(program);
        return kExitConfig;
    }

    for (const auto& arg : config.ignored_args) {
        std::cerr << "[Cli] Ignoring unknown option: " << arg << std::endl;
    }

    return run(config);
}
