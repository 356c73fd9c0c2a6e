/**
 * @file Registry.cpp
 * @brief Method lookup and dispatch implementation
 */

#include <ImgEntropy/Entropy/Registry.h>
#include <ImgEntropy/Core/Exception.h>

#include <type_traits>

namespace Img::Entropy {

namespace {

template<MethodKind Kind>
using ParamsOf = std::variant_alternative_t<static_cast<size_t>(Kind), MethodConfig>;

static_assert(std::variant_size_v<MethodConfig> ==
                  static_cast<size_t>(MethodKind::RegionalShannon2D) + 1,
              "MethodConfig needs one alternative per MethodKind");
static_assert(std::is_same_v<ParamsOf<MethodKind::Kapur1D>, Kapur1DParams>);
static_assert(std::is_same_v<ParamsOf<MethodKind::Scipy1D>, Scipy1DParams>);
static_assert(std::is_same_v<ParamsOf<MethodKind::Shannon1D>, Shannon1DParams>);
static_assert(std::is_same_v<ParamsOf<MethodKind::Delentropy2D>, DelentropyParams>);
static_assert(std::is_same_v<ParamsOf<MethodKind::Gradient2D>, GradientParams>);
static_assert(std::is_same_v<ParamsOf<MethodKind::RegionalScikit2D>, RegionalDiskParams>);
static_assert(std::is_same_v<ParamsOf<MethodKind::RegionalShannon2D>, RegionalShannonParams>);

const std::vector<MethodInfo> g_methods = {
    {MethodKind::Kapur1D, "1d-kapur",
     "Kapur bi-level threshold entropy", false, false},
    {MethodKind::Scipy1D, "1d-scipy",
     "Shannon entropy of normalized intensities, base 8", false, false},
    {MethodKind::Shannon1D, "1d-shannon",
     "Shannon entropy of normalized intensities, base 2", false, false},
    {MethodKind::Delentropy2D, "2d-delentropy",
     "Entropy of the joint gradient density (delentropy)", false, false},
    {MethodKind::Gradient2D, "2d-gradient",
     "Combined gradient visualization", false, false},
    {MethodKind::RegionalScikit2D, "2d-regional-scikit",
     "Local entropy over a disk neighbourhood", false, true},
    {MethodKind::RegionalShannon2D, "2d-regional-shannon",
     "Local entropy over a square sliding window", true, false},
};

} // anonymous namespace

// =============================================================================
// Lookup
// =============================================================================

const std::vector<MethodInfo>& ListMethods() {
    return g_methods;
}

const MethodInfo& GetMethodInfo(MethodKind kind) {
    for (const auto& info : g_methods) {
        if (info.kind == kind) return info;
    }
    throw InvalidArgumentException("Unknown method kind " +
                                   std::to_string(static_cast<int>(kind)));
}

std::string MethodKindName(MethodKind kind) {
    return GetMethodInfo(kind).name;
}

MethodKind ParseMethodKind(const std::string& name) {
    for (const auto& info : g_methods) {
        if (name == info.name) return info.kind;
    }
    if (name == "pseudo-spatial") {
        return MethodKind::RegionalShannon2D;
    }
    throw InvalidArgumentException(name + " is not a valid method.");
}

MethodKind KindOf(const MethodConfig& config) {
    return static_cast<MethodKind>(config.index());
}

// =============================================================================
// Configuration
// =============================================================================

MethodConfig DefaultConfig(MethodKind kind) {
    switch (kind) {
        case MethodKind::Kapur1D: return Kapur1DParams{};
        case MethodKind::Scipy1D: return Scipy1DParams{};
        case MethodKind::Shannon1D: return Shannon1DParams{};
        case MethodKind::Delentropy2D: return DelentropyParams{};
        case MethodKind::Gradient2D: return GradientParams{};
        case MethodKind::RegionalScikit2D: return RegionalDiskParams{};
        case MethodKind::RegionalShannon2D: return RegionalShannonParams{};
    }
    throw InvalidArgumentException("Unknown method kind " +
                                   std::to_string(static_cast<int>(kind)));
}

MethodConfig MakeConfig(MethodKind kind, int32_t kernelSize, int32_t radius) {
    switch (kind) {
        case MethodKind::RegionalScikit2D:
            return RegionalDiskParams().SetRadius(radius);
        case MethodKind::RegionalShannon2D:
            return RegionalShannonParams().SetKernelSize(kernelSize);
        default:
            return DefaultConfig(kind);
    }
}

// =============================================================================
// Dispatch
// =============================================================================

MethodResult RunMethod(const MethodConfig& config, const IntensityArray& grey,
                       const Image* colour) {
    MethodResult result;

    switch (KindOf(config)) {
        case MethodKind::Kapur1D:
            result = Kapur1D(grey, std::get<Kapur1DParams>(config));
            break;
        case MethodKind::Scipy1D:
            result = Scipy1D(grey, std::get<Scipy1DParams>(config));
            break;
        case MethodKind::Shannon1D:
            result = Shannon1D(grey, std::get<Shannon1DParams>(config));
            break;
        case MethodKind::Delentropy2D:
            result = Delentropy2D(grey, std::get<DelentropyParams>(config));
            break;
        case MethodKind::Gradient2D:
            result = Gradient2D(grey, std::get<GradientParams>(config));
            break;
        case MethodKind::RegionalScikit2D:
            result = RegionalDisk2D(grey, std::get<RegionalDiskParams>(config));
            break;
        case MethodKind::RegionalShannon2D:
            result = RegionalShannon2D(grey, std::get<RegionalShannonParams>(config));
            break;
    }

    // Methods without artifacts have nothing to show alongside
    if (!result.artifacts.empty()) {
        result.grey = grey;
        if (colour != nullptr && !colour->Empty()) {
            result.colour = *colour;
        }
    }
    return result;
}

} // namespace Img::Entropy
