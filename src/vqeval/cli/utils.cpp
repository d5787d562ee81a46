#include "utils.hpp"
#include "args.hpp"

#include "vqeval/core/QualityBands.hpp"

#include <cmath>
#include <iomanip>
#include <stdexcept>

bool parse_size(const std::string& s, int& w, int& h) {
    if (s == "native") { w = 0; h = 0; return true; }
    const auto xPos = s.find('x');
    if (xPos == std::string::npos || xPos == 0 || xPos + 1 >= s.size()) return false;
    try {
        std::size_t uw = 0, uh = 0;
        const std::string sw = s.substr(0, xPos), sh = s.substr(xPos + 1);
        const int pw = std::stoi(sw, &uw);
        const int ph = std::stoi(sh, &uh);
        if (uw != sw.size() || uh != sh.size() || pw <= 0 || ph <= 0) return false;
        w = pw; h = ph;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

vqeval::EvalConfig config_from_args(int argc, char** argv) {
    vqeval::EvalConfig cfg{};

    const int samples = argValueInt(argc, argv, "samples", static_cast<int>(cfg.maxSamples));
    if (samples < 0) throw std::invalid_argument("--samples must be >= 0");
    cfg.maxSamples = static_cast<std::size_t>(samples);
    if (argHas(argc, argv, "exhaustive")) cfg.maxSamples = 0;

    const std::string size = argValue(argc, argv, "size", "");
    if (!size.empty() && !parse_size(size, cfg.targetWidth, cfg.targetHeight))
        throw std::invalid_argument("--size: expected WxH or 'native', got '" + size + "'");

    cfg.ssimWindow = argValueInt(argc, argv, "window", cfg.ssimWindow);

    const int threads = argValueInt(argc, argv, "threads", 0);
    if (threads < 0) throw std::invalid_argument("--threads must be >= 0");
    cfg.workerThreads = static_cast<std::size_t>(threads);

    cfg.validate();
    return cfg;
}

void print_result(std::ostream& os, const std::string& label,
                  const vqeval::EvaluationResult& r)
{
    const auto flags = os.flags();
    const auto prec  = os.precision();

    os << "=== " << label << " ===\n";
    os << "PSNR: ";
    if (std::isinf(r.meanPsnr)) os << "inf";
    else os << std::fixed << std::setprecision(2) << r.meanPsnr;
    os << " dB  (" << vqeval::label(vqeval::psnrBand(r.meanPsnr)) << ")\n";

    os << "SSIM: " << std::fixed << std::setprecision(4) << r.meanSsim
       << "  (" << vqeval::label(vqeval::ssimBand(r.meanSsim)) << ")\n";

    os << "compared " << r.count << "/" << r.planned << " pairs";
    if (r.partial()) os << " (source ended early)";
    os << "\n";

    os.flags(flags);
    os.precision(prec);
}

void print_info(std::ostream& os, const vqeval::SourceInfo& si) {
    const auto flags = os.flags();
    const auto prec  = os.precision();

    os << "Path      : " << si.path << "\n"
       << "Container : " << (si.container.empty() ? "unknown" : si.container) << "\n"
       << "Frames    : " << si.frameCount << "\n"
       << "Resolution: " << si.width << "x" << si.height << "\n"
       << std::fixed << std::setprecision(2)
       << "FPS       : " << si.fps << "\n"
       << "Duration  : " << si.durationSec << " s\n"
       << "Size      : " << static_cast<double>(si.fileBytes) / (1024.0 * 1024.0) << " MB\n";

    os.flags(flags);
    os.precision(prec);
}
