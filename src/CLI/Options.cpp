/**
 * @file Options.cpp
 * @brief Command-line option parsing implementation
 */

#include <ImgEntropy/CLI/Options.h>
#include <ImgEntropy/Core/Exception.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace Img::Entropy::CLI {

namespace {

// Whole-string integer conversion
bool ParseInt(const std::string& value, int32_t& out) {
    if (value.empty()) return false;
    size_t pos = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &pos);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    if (pos != value.size() || parsed < INT32_MIN || parsed > INT32_MAX) {
        return false;
    }
    out = static_cast<int32_t>(parsed);
    return true;
}

// One command-line token split into option name and attached value
struct Token {
    std::string name;
    std::string value;
    bool hasValue = false;
};

bool TakesValue(const std::string& name) {
    return name == "-i" || name == "--input" || name == "-m" || name == "--method" ||
           name == "-k" || name == "--kernel-size" || name == "-r" || name == "--radius" ||
           name == "-o" || name == "--output-dir";
}

// "--name=value" and "-xVALUE" carry their value in the same token
Token SplitToken(const std::string& arg) {
    Token token{arg, "", false};
    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            token = Token{arg.substr(0, eq), arg.substr(eq + 1), true};
        }
    } else if (arg.size() > 2 && arg[0] == '-' && TakesValue(arg.substr(0, 2))) {
        token = Token{arg.substr(0, 2), arg.substr(2), true};
    }
    return token;
}

std::string RequireValue(const std::vector<std::string>& args, size_t& i, const Token& token) {
    if (token.hasValue) {
        return token.value;
    }
    if (i + 1 >= args.size()) {
        throw InvalidArgumentException("option " + token.name + " requires a value");
    }
    return args[++i];
}

void RejectValue(const Token& token) {
    if (token.hasValue) {
        throw InvalidArgumentException("option " + token.name +
                                       " does not take a value: '" + token.value + "'");
    }
}

} // anonymous namespace

int32_t ParseKernelSize(const std::string& value) {
    int32_t size = 0;
    if (!ParseInt(value, size) || size < MIN_KERNEL_SIZE || size % 2 != 1) {
        throw InvalidArgumentException(value + " is not a valid kernel size.");
    }
    return size;
}

int32_t ParseRadius(const std::string& value) {
    int32_t radius = 0;
    if (!ParseInt(value, radius) || radius < 1) {
        throw InvalidArgumentException(value + " is not a valid radius.");
    }
    return radius;
}

CliOptions ParseCliOptions(const std::vector<std::string>& args) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const Token token = SplitToken(args[i]);
        const std::string& arg = token.name;

        if (arg == "-h" || arg == "--help") {
            RejectValue(token);
            options.help = true;
        } else if (arg == "-i" || arg == "--input") {
            options.input = RequireValue(args, i, token);
        } else if (arg == "-m" || arg == "--method") {
            options.method = ParseMethodKind(RequireValue(args, i, token));
        } else if (arg == "-k" || arg == "--kernel-size") {
            options.kernelSize = ParseKernelSize(RequireValue(args, i, token));
        } else if (arg == "-r" || arg == "--radius") {
            options.radius = ParseRadius(RequireValue(args, i, token));
        } else if (arg == "-o" || arg == "--output-dir") {
            options.outputDir = RequireValue(args, i, token);
        } else if (arg == "--no-show") {
            RejectValue(token);
            options.show = false;
        } else if (arg == "-q" || arg == "--quiet") {
            RejectValue(token);
            options.quiet = true;
        } else {
            throw InvalidArgumentException("unrecognized argument: " + args[i]);
        }
    }

    if (!options.help && options.input.empty()) {
        throw InvalidArgumentException("the following arguments are required: -i/--input");
    }
    return options;
}

CliOptions ParseCliOptions(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return ParseCliOptions(args);
}

std::string Usage(const std::string& program) {
    std::ostringstream oss;
    oss << "usage: " << program << " -i PATH [-m METHOD] [-k SIZE] [-r RADIUS]"
        << " [-o DIR] [--no-show] [--quiet]\n\n"
        << "Image Entropy\n\n"
        << "options:\n"
        << "  -h, --help               show this help message and exit\n"
        << "  -i, --input PATH         path to input image file\n"
        << "  -m, --method METHOD      method to use (default: "
        << MethodKindName(DEFAULT_METHOD) << ")\n"
        << "  -k, --kernel-size SIZE   kernel size. must be a positive odd integer."
        << " (default: " << DEFAULT_KERNEL_SIZE << ", minimum: " << MIN_KERNEL_SIZE << ")\n"
        << "  -r, --radius RADIUS      disk radius of 2d-regional-scikit (default: "
        << DEFAULT_DISK_RADIUS << ")\n"
        << "  -o, --output-dir DIR     directory for rendered panels\n"
        << "      --no-show            write panels without opening a viewer\n"
        << "  -q, --quiet              only print results\n\n"
        << "methods:\n";
    for (const auto& info : ListMethods()) {
        oss << "  " << info.name << std::string(22 - std::string(info.name).size(), ' ')
            << info.description << "\n";
    }
    return oss.str();
}

} // namespace Img::Entropy::CLI
