/**
 * @file Display.cpp
 * @brief Rendering of method results to image files implementation
 */

#include <ImgEntropy/Display/Display.h>
#include <ImgEntropy/Color/ColorConvert.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Exception.h>
#include <ImgEntropy/IO/ImageIO.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace Img::Entropy {

namespace {

// Output directory for written panels
std::string g_outputDir;

std::string GetDefaultOutputDir() {
#ifdef _WIN32
    const char* temp = std::getenv("TEMP");
    if (temp) {
        return std::string(temp) + "\\imgentropy\\";
    }
    return "C:\\Temp\\imgentropy\\";
#else
    return "/tmp/imgentropy/";
#endif
}

// Sanitize filename
std::string SanitizeFilename(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            result += c;
        } else if (c == ' ') {
            result += '_';
        }
    }
    return result.empty() ? "image" : result;
}

// Check if running in WSL
bool IsWSL() {
    static int isWsl = -1;
    if (isWsl < 0) {
        isWsl = 0;
#ifndef _WIN32
        std::ifstream file("/proc/version");
        std::string content;
        if (file && std::getline(file, content)) {
            std::transform(content.begin(), content.end(), content.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (content.find("microsoft") != std::string::npos ||
                content.find("wsl") != std::string::npos) {
                isWsl = 1;
            }
        }
#endif
    }
    return isWsl == 1;
}

// Open image with system viewer
bool OpenWithViewer(const std::string& filepath) {
#ifdef _WIN32
    std::string cmd = "start \"\" \"" + filepath + "\"";
    return std::system(cmd.c_str()) == 0;
#else
    if (IsWSL()) {
        std::string cmd = "explorer.exe \"$(wslpath -w '" + filepath + "')\" 2>/dev/null &";
        return std::system(cmd.c_str()) == 0;
    } else {
        std::string cmd = "xdg-open \"" + filepath + "\" 2>/dev/null &";
        return std::system(cmd.c_str()) == 0;
    }
#endif
}

inline uint8_t ToByte(double v) {
    return static_cast<uint8_t>(Clamp(static_cast<int32_t>(std::lround(v)), 0, MAX_INTENSITY));
}

} // anonymous namespace

// =============================================================================
// Rendering
// =============================================================================

Rgb JetColor(double t) {
    t = Clamp(t, 0.0, 1.0);
    // Piecewise-linear jet: each channel is a trapezoid over [0, 1]
    auto channel = [t](double center) {
        return Clamp(1.5 - std::abs(4.0 * t - center), 0.0, 1.0);
    };
    return Rgb{ToByte(255.0 * channel(3.0)), ToByte(255.0 * channel(2.0)),
               ToByte(255.0 * channel(1.0))};
}

Image RenderArray(const RealArray& data, bool colour) {
    if (data.Empty()) return Image();

    auto [minIt, maxIt] = std::minmax_element(data.begin(), data.end());
    const double minVal = *minIt;
    const double span = *maxIt - *minIt;

    Image result(data.Width(), data.Height(), colour ? ChannelType::RGB : ChannelType::Gray);
    for (int32_t y = 0; y < data.Height(); ++y) {
        const double* src = data.RowPtr(y);
        uint8_t* dst = result.RowPtr(y);
        for (int32_t x = 0; x < data.Width(); ++x) {
            double t = span > 0.0 ? (src[x] - minVal) / span : 0.5;
            if (colour) {
                Rgb c = JetColor(t);
                dst[x * 3 + 0] = c.r;
                dst[x * 3 + 1] = c.g;
                dst[x * 3 + 2] = c.b;
            } else {
                dst[x] = ToByte(255.0 * t);
            }
        }
    }
    return result;
}

Image AttachColorBar(const Image& panel, int32_t barWidth) {
    if (panel.Empty()) return Image();

    Image rgb = panel.GetChannelType() == ChannelType::RGB
                    ? panel
                    : Color::GrayToRgb(Color::Rgb1ToGray(panel));

    const int32_t h = rgb.Height();
    const int32_t w = rgb.Width();
    if (barWidth <= 0) {
        barWidth = std::max(4, w / 16);
    }
    const int32_t gap = std::max(2, barWidth / 2);

    Image result(w + gap + barWidth, h, ChannelType::RGB);
    for (int32_t y = 0; y < h; ++y) {
        const uint8_t* src = rgb.RowPtr(y);
        uint8_t* dst = result.RowPtr(y);
        std::copy(src, src + rgb.Stride(), dst);

        // Gap stays black; bar maximum at the top row
        Rgb c = JetColor(h > 1 ? 1.0 - static_cast<double>(y) / (h - 1) : 1.0);
        for (int32_t x = w + gap; x < w + gap + barWidth; ++x) {
            dst[x * 3 + 0] = c.r;
            dst[x * 3 + 1] = c.g;
            dst[x * 3 + 2] = c.b;
        }
    }
    return result;
}

Image RenderArtifact(const Artifact& artifact) {
    const bool hasBar = artifact.HasHint(RenderHint::HasBar);
    const bool colour = hasBar || artifact.HasHint(RenderHint::ForceColour);

    Image panel = RenderArray(artifact.data, colour);
    return hasBar ? AttachColorBar(panel) : panel;
}

// =============================================================================
// Display
// =============================================================================

void SetDispOutputDir(const std::string& path) {
    g_outputDir = path;
    if (!g_outputDir.empty() && g_outputDir.back() != '/' && g_outputDir.back() != '\\') {
#ifdef _WIN32
        g_outputDir += '\\';
#else
        g_outputDir += '/';
#endif
    }
}

std::string GetDispOutputDir() {
    return g_outputDir.empty() ? GetDefaultOutputDir() : g_outputDir;
}

std::string DispImage(const Image& image, const std::string& title, bool open) {
    if (image.Empty()) {
        throw InvalidArgumentException("Cannot display empty image: " + title);
    }

    std::string outDir = GetDispOutputDir();
    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec) {
        throw IOException("Cannot create output directory " + outDir + ": " + ec.message());
    }

    std::string filepath = outDir + SanitizeFilename(title) + ".png";
    if (!IO::WriteImage(image, filepath)) {
        throw IOException("Failed to write image: " + filepath);
    }

    // A missing viewer is not an error; the file is written either way
    if (open) {
        OpenWithViewer(filepath);
    }
    return filepath;
}

std::vector<std::string> DispResult(const MethodResult& result, const std::string& title,
                                    bool open) {
    std::vector<std::string> paths;
    int32_t index = 1;
    auto prefix = [&](const std::string& label) {
        return title + "_" + std::to_string(index++) + "_" + label;
    };

    if (result.colour) {
        paths.push_back(DispImage(*result.colour, prefix("Input Image"), open));
    }
    if (result.grey) {
        paths.push_back(DispImage(RenderArray(result.grey->Cast<double>(), false),
                                  prefix("Greyscale Image"), open));
    }
    for (const auto& artifact : result.artifacts) {
        paths.push_back(DispImage(RenderArtifact(artifact), prefix(artifact.label), open));
    }
    return paths;
}

int32_t CleanDispImages() {
    std::string outDir = GetDispOutputDir();
    std::error_code ec;
    if (!std::filesystem::is_directory(outDir, ec)) {
        return 0;
    }

    int32_t removed = 0;
    for (const auto& entry : std::filesystem::directory_iterator(outDir, ec)) {
        if (!entry.is_regular_file()) continue;
        auto ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".png") {
            if (std::filesystem::remove(entry.path(), ec)) {
                ++removed;
            } else if (ec) {
                throw IOException("Cannot remove " + entry.path().string() + ": " + ec.message());
            }
        }
    }
    if (ec) {
        throw IOException("Cannot list " + outDir + ": " + ec.message());
    }
    return removed;
}

} // namespace Img::Entropy
