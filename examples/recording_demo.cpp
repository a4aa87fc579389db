/**
 * Scribe 录音转写示例
 *
 * Usage:
 *   ./scribe_record <duration> [-m MODEL]
 *
 * Examples:
 *   ./scribe_record 5
 *   ./scribe_record 10 -m base.en
 */

#include <iostream>
#include <string>

#include "scribe/cancellation.hpp"
#include "scribe/params.hpp"
#include "scribe/recording.hpp"
#include "scribe/scribe.hpp"

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <duration> [-m MODEL]" << std::endl;
    std::cout << std::endl;
    std::cout << "Arguments:" << std::endl;
    std::cout << "  duration        Duration in seconds" << std::endl;
    std::cout << "  -m, --model     Whisper.cpp model, default to tiny.en" << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "===================================================================" << std::endl;
    std::cout << "Scribe" << std::endl;
    std::cout << "A simple example of transcribing a recording, based on whisper.cpp" << std::endl;
    std::cout << "Version: " << scribe::getVersionString() << std::endl;
    std::cout << "===================================================================" << std::endl;

    std::string duration_arg;
    std::string model = "tiny.en";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-m" || arg == "--model") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " expects a value" << std::endl;
                return 1;
            }
            model = argv[++i];
        } else if (arg.compare(0, 8, "--model=") == 0) {
            model = arg.substr(8);
        } else if (duration_arg.empty()) {
            duration_arg = arg;
        } else {
            std::cerr << "error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (duration_arg.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    scribe::ParamValue duration;
    auto err = scribe::parseParamValue(scribe::ParamType::INT, duration_arg, duration);
    if (!err.isOk() || scribe::paramAsInt(duration) <= 0) {
        std::cerr << "error: duration must be a positive number of seconds" << std::endl;
        return 1;
    }

    scribe::installInterruptHandler();

    scribe::Recording recording(scribe::paramAsInt(duration), model);
    recording.setCancellationToken(&scribe::interruptToken());

    err = recording.start();
    if (err.code == scribe::ErrorCode::CANCELLED) {
        std::cout << "[Recording] Stopped" << std::endl;
        return 130;
    }
    if (!err.isOk()) {
        std::cerr << "[Recording] " << err.describe() << std::endl;
        return 1;
    }

    return 0;
}
