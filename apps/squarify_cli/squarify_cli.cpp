// Command-line host for the squarify pipeline
// Build via CMake target: squarify_cli

#include "pipeline/pipeline.hpp"
#include "util/ColorSpec.hpp"
#include "util/PipelineError.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace squarify;

namespace
{
    void usage(const char* argv0)
    {
        std::cerr << "Usage: " << argv0 << " --input <path> [--output <path>] [--size <px>]\n"
                  << "       [--transparent] [--detect] [--match] [--color <#rrggbb|rgb(r,g,b)|name>]\n"
                  << "       [--compression <0-9>] [--verbose]\n";
    }

    int parseInt(const std::string& flag, const std::string& value)
    {
        std::size_t used = 0;
        int v = 0;
        try
        {
            v = std::stoi(value, &used);
        }
        catch (const std::exception&)
        {
            used = 0;
        }
        if (used == 0 || used != value.size())
            throw PipelineError(ErrorKind::InvalidParameter, flag + " expects an integer, got \"" + value + "\"");
        return v;
    }

    bool readFile(const std::string& path, std::vector<uchar>& bytes)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) return false;
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return !in.bad();
    }

    bool writeFile(const std::string& path, const std::vector<uchar>& bytes)
    {
        const std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
        std::ofstream out(path, std::ios::binary);
        if (!out) return false;
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return static_cast<bool>(out);
    }

    std::string upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

int main(int argc, char** argv)
{
    std::string inputPath, outputPath = "square_image.png";
    SquareSettings settings;
    bool detect = false, match = false;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw PipelineError(ErrorKind::InvalidParameter, arg + " needs a value");
                return argv[++i];
            };

            if (arg == "--input") inputPath = next();
            else if (arg == "--output") outputPath = next();
            else if (arg == "--size") settings.desiredSize = parseInt(arg, next());
            else if (arg == "--transparent") settings.transparency.enabled = true;
            else if (arg == "--detect") detect = true;
            else if (arg == "--match") match = true;
            else if (arg == "--color") settings.transparency.color = util::parseColor(next());
            else if (arg == "--compression") settings.pngCompression = parseInt(arg, next());
            else if (arg == "--verbose") settings.verbose = true;
            else if (arg == "--help" || arg == "-h") { usage(argv[0]); return 0; }
            else throw PipelineError(ErrorKind::InvalidParameter, "unknown option " + arg);
        }
        if (inputPath.empty()) throw PipelineError(ErrorKind::InvalidParameter, "--input is required");

        // --detect and --match only mean something once transparency is on
        if (settings.transparency.enabled)
        {
            settings.transparency.autoDetect = detect;
            settings.transparency.mode = match ? TransparencyMode::ExactMatch : TransparencyMode::SimilarityFalloff;
        }
        else if (detect || match)
        {
            std::cerr << "[squarify] --detect/--match ignored without --transparent\n";
        }

        std::vector<uchar> bytes;
        if (!readFile(inputPath, bytes))
        {
            std::cerr << "[squarify] ERROR: cannot open \"" << inputPath << "\"\n";
            return 1;
        }

        PipelineResult res = runPipeline(bytes, settings);

        std::cout << "Input resolution: " << res.inputWidth << "x" << res.inputHeight << "\n"
                  << "Max image size [px]: " << res.naturalMaxSize << "\n"
                  << "Output resolution: " << res.usedSize << "x" << res.usedSize << "\n";
        if (res.detectedColor)
        {
            const Rgb& c = *res.detectedColor;
            std::cout << "Detected background color: " << upper(res.detectedHex)
                      << " (" << c.r << ", " << c.g << ", " << c.b << ")\n";
        }

        if (!writeFile(outputPath, res.png))
        {
            std::cerr << "[squarify] ERROR: cannot write \"" << outputPath << "\"\n";
            return 1;
        }
        std::cout << "Saved to " << outputPath << "\n";
        return 0;
    }
    catch (const PipelineError& e)
    {
        std::cerr << "[squarify] ERROR (" << errorKindName(e.kind()) << "): " << e.what() << "\n";
        if (e.kind() == ErrorKind::InvalidParameter)
        {
            usage(argv[0]);
            return 2;
        }
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[squarify] ERROR: " << e.what() << "\n";
        return 1;
    }
}
