#pragma once

/**
 * @file Options.h
 * @brief Command-line options of the image_entropy tool
 *
 * Usage:
 *   image_entropy -i PATH [-m METHOD] [-k SIZE] [-r RADIUS]
 *                 [-o DIR] [--no-show] [--quiet]
 */

#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Entropy/Registry.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Img::Entropy::CLI {

/**
 * @brief Parsed and validated options
 */
struct CliOptions {
    std::string input;                          ///< Input image path (required)
    MethodKind method = DEFAULT_METHOD;         ///< Entropy method
    int32_t kernelSize = DEFAULT_KERNEL_SIZE;   ///< Window size, odd >= 3
    int32_t radius = DEFAULT_DISK_RADIUS;       ///< Disk radius >= 1
    std::string outputDir;                      ///< Panel directory (empty = default)
    bool show = true;                           ///< Open panels with the viewer
    bool quiet = false;                         ///< Suppress progress lines
    bool help = false;                          ///< Print usage and exit
};

/**
 * @brief Parse arguments (without the program name)
 *
 * Values follow their option as the next argument, after '=' for long
 * options (--kernel-size=5) or attached to short options (-k5).
 *
 * @throws InvalidArgumentException for unknown flags, missing values, an
 *         invalid method, kernel size or radius, or a missing --input
 */
CliOptions ParseCliOptions(const std::vector<std::string>& args);

/**
 * @brief Parse main()'s argc / argv
 */
CliOptions ParseCliOptions(int argc, const char* const* argv);

/**
 * @brief Parse a kernel size: integer, odd, >= 3
 * @throws InvalidArgumentException otherwise
 */
int32_t ParseKernelSize(const std::string& value);

/**
 * @brief Parse a disk radius: integer >= 1
 * @throws InvalidArgumentException otherwise
 */
int32_t ParseRadius(const std::string& value);

/**
 * @brief Usage text
 */
std::string Usage(const std::string& program);

} // namespace Img::Entropy::CLI
