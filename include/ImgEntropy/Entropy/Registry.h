#pragma once

/**
 * @file Registry.h
 * @brief Method identifiers and dispatch
 *
 * A method is selected by a MethodKind; its parameters travel as a
 * MethodConfig, a variant holding exactly one parameter set. The variant
 * alternatives are declared in MethodKind order, so the active index is the
 * kind tag.
 *
 * @code
 * MethodConfig config = MakeConfig(ParseMethodKind("2d-regional-shannon"), 7, 5);
 * MethodResult result = RunMethod(config, grey);
 * @endcode
 */

#include <ImgEntropy/Core/Array2D.h>
#include <ImgEntropy/Core/Image.h>
#include <ImgEntropy/Entropy/MethodParams.h>
#include <ImgEntropy/Entropy/Methods.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace Img::Entropy {

/**
 * @brief One case per entropy method
 */
enum class MethodKind {
    Kapur1D,            ///< "1d-kapur"
    Scipy1D,            ///< "1d-scipy"
    Shannon1D,          ///< "1d-shannon"
    Delentropy2D,       ///< "2d-delentropy" (default)
    Gradient2D,         ///< "2d-gradient"
    RegionalScikit2D,   ///< "2d-regional-scikit"
    RegionalShannon2D   ///< "2d-regional-shannon"
};

/**
 * @brief Parameter set of the selected method, tagged by its variant index
 */
using MethodConfig = std::variant<Kapur1DParams,
                                  Scipy1DParams,
                                  Shannon1DParams,
                                  DelentropyParams,
                                  GradientParams,
                                  RegionalDiskParams,
                                  RegionalShannonParams>;

/**
 * @brief Static description of a method
 */
struct MethodInfo {
    MethodKind kind;
    const char* name;           ///< Command-line identifier
    const char* description;
    bool usesKernelSize;
    bool usesRadius;
};

/// Method used when none is requested
constexpr MethodKind DEFAULT_METHOD = MethodKind::Delentropy2D;

// =============================================================================
// Lookup
// =============================================================================

/**
 * @brief All methods in MethodKind order
 */
const std::vector<MethodInfo>& ListMethods();

/**
 * @brief Description of one method
 */
const MethodInfo& GetMethodInfo(MethodKind kind);

/**
 * @brief Command-line identifier of a method
 */
std::string MethodKindName(MethodKind kind);

/**
 * @brief Parse a method identifier
 *
 * Accepts the identifiers of ListMethods() and "pseudo-spatial" as an alias
 * of "2d-regional-shannon".
 *
 * @throws InvalidArgumentException for unknown names
 */
MethodKind ParseMethodKind(const std::string& name);

/**
 * @brief Kind tag of a configuration
 */
MethodKind KindOf(const MethodConfig& config);

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Default parameters of a method
 */
MethodConfig DefaultConfig(MethodKind kind);

/**
 * @brief Parameters of a method with the shared window settings applied
 *
 * kernelSize only reaches RegionalShannon2D, radius only RegionalScikit2D.
 */
MethodConfig MakeConfig(MethodKind kind, int32_t kernelSize, int32_t radius);

// =============================================================================
// Dispatch
// =============================================================================

/**
 * @brief Run the configured method
 *
 * When the method produces display output, the result also carries the
 * greyscale input and, if given, the colour image.
 *
 * @param config Method and parameters
 * @param grey Greyscale intensities (read-only)
 * @param colour Optional colour image for display
 */
MethodResult RunMethod(const MethodConfig& config, const IntensityArray& grey,
                       const Image* colour = nullptr);

} // namespace Img::Entropy
