/**
 * @file image_entropy.cpp
 * @brief Assess and display the entropy of an image
 *
 * Reads one image, converts it to greyscale, runs the selected entropy
 * method, prints the results and renders the diagnostic panels.
 *
 * Resources:
 * - 2d-gradient, 2d-delentropy: https://arxiv.org/abs/1609.01117
 * - 2d-delentropy reference:    https://github.com/Causticity/sipp
 * - 1d-kapur:                   https://doi.org/10.1080/09720502.2020.1731976
 *
 * Exit codes: 0 success, 1 runtime failure, 2 usage error.
 */

#include <ImgEntropy/CLI/Options.h>
#include <ImgEntropy/Color/ColorConvert.h>
#include <ImgEntropy/Core/Exception.h>
#include <ImgEntropy/Display/Display.h>
#include <ImgEntropy/Entropy/Registry.h>
#include <ImgEntropy/IO/ImageIO.h>

#include <exception>
#include <iostream>
#include <sstream>
#include <string>

using namespace Img::Entropy;

namespace {

std::string g_execName = "image_entropy";
bool g_quiet = false;

void Log(const std::string& msg) {
    std::cout << g_execName << ": " << msg << std::endl;
}

void Progress(const std::string& msg) {
    if (!g_quiet) Log(msg);
}

void LogError(const std::string& msg) {
    std::cerr << g_execName << ": error: " << msg << std::endl;
}

std::string Format(double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    return oss.str();
}

void PrintSummary(const EntropySummary& summary) {
    if (summary.kind == SummaryKind::Gradient) {
        Log("gradient = " + Format(summary.value) + " ± " + Format(summary.stdDev.value_or(0.0)));
        return;
    }

    if (summary.stdDev) {
        Log("entropy = " + Format(summary.value) + " ± " + Format(*summary.stdDev));
    } else {
        Log("entropy: " + Format(summary.value));
    }
    if (summary.threshold) {
        Log("threshold: " + std::to_string(*summary.threshold));
    }
    Log("entropy ratio: " + Format(summary.Ratio()));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc > 0) {
        g_execName = argv[0];
    }

    CLI::CliOptions options;
    try {
        options = CLI::ParseCliOptions(argc, argv);
    } catch (const InvalidArgumentException& e) {
        std::cerr << CLI::Usage(g_execName) << "\n";
        LogError(e.what());
        return 2;
    }

    if (options.help) {
        std::cout << CLI::Usage(g_execName);
        return 0;
    }
    g_quiet = options.quiet;

    try {
        Progress("reading image");
        Image colour = IO::ReadImage(options.input);
        IntensityArray grey = Color::ToIntensityArray(colour);

        Progress("processing image with " + MethodKindName(options.method));
        MethodConfig config = MakeConfig(options.method, options.kernelSize, options.radius);
        MethodResult result = RunMethod(config, grey, &colour);

        PrintSummary(result.summary);

        if (result.HasDisplay()) {
            Progress("showing image");
            if (!options.outputDir.empty()) {
                SetDispOutputDir(options.outputDir);
            }
            for (const auto& path : DispResult(result, MethodKindName(options.method),
                                               options.show)) {
                Progress("wrote " + path);
            }
        }
    } catch (const GradientRangeException& e) {
        LogError(std::string("assertion failed: ") + e.what());
        return 1;
    } catch (const Exception& e) {
        LogError(e.what());
        return 1;
    } catch (const std::exception& e) {
        LogError(e.what());
        return 1;
    }

    return 0;
}
