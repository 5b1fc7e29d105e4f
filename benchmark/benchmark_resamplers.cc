#include <resampler/unified_resampler.hh>
#include <resampler/mode_capabilities.hh>
#include <resampler/pixel_buffer.hh>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace resampler;

// Timing utilities
class Timer {
    using Clock = std::chrono::high_resolution_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double, std::milli>;

    TimePoint start_time;

public:
    void start() {
        start_time = Clock::now();
    }

    double elapsed_ms() const {
        Duration diff = Clock::now() - start_time;
        return diff.count();
    }
};

// Statistics tracker
struct BenchmarkStats {
    double min_time = std::numeric_limits<double>::max();
    double max_time = 0.0;
    double total_time = 0.0;
    double total_time_sq = 0.0;
    int runs = 0;

    void add_sample(double time_ms) {
        min_time = std::min(min_time, time_ms);
        max_time = std::max(max_time, time_ms);
        total_time += time_ms;
        total_time_sq += time_ms * time_ms;
        runs++;
    }

    double mean() const {
        return runs > 0 ? total_time / runs : 0.0;
    }

    double stddev() const {
        if (runs <= 1) return 0.0;
        double mean_val = mean();
        return std::sqrt(std::max(0.0, (total_time_sq / runs) - (mean_val * mean_val)));
    }

    // Output megapixels per second
    double throughput_mpps(dimension_t width, dimension_t height) const {
        double pixels = static_cast<double>(width) * static_cast<double>(height);
        double mean_ms = mean();
        if (mean_ms <= 0) return 0.0;
        return (pixels / 1000000.0) / (mean_ms / 1000.0);
    }
};

// Test image generator
pixel_buffer create_test_image(dimension_t width, dimension_t height, const std::string& pattern) {
    pixel_buffer image(width, height, 3);
    std::mt19937 rng(42);  // Fixed seed for reproducibility

    if (pattern == "random") {
        std::uniform_int_distribution<int> dist(0, 255);
        for (index_t y = 0; y < height; ++y) {
            for (auto& byte : image.row(y)) {
                byte = static_cast<std::uint8_t>(dist(rng));
            }
        }
    } else if (pattern == "gradient") {
        for (index_t y = 0; y < height; ++y) {
            for (index_t x = 0; x < width; ++x) {
                const auto r = static_cast<std::uint8_t>((x * 255) / width);
                const auto g = static_cast<std::uint8_t>((y * 255) / height);
                const auto b = static_cast<std::uint8_t>(((x + y) * 255) / (width + height));
                image.set_pixel(x, y, pixel_value::from_rgb(r, g, b));
            }
        }
    } else if (pattern == "checkerboard") {
        for (index_t y = 0; y < height; ++y) {
            for (index_t x = 0; x < width; ++x) {
                const bool is_white = ((x / 8) + (y / 8)) % 2 == 0;
                const std::uint8_t color = is_white ? 255 : 0;
                image.set_pixel(x, y, {color, color, color});
            }
        }
    } else {
        image = pixel_buffer::filled(width, height, 3, {128, 128, 128});
    }

    return image;
}

struct BenchmarkCase {
    std::string description;
    dimension_t src_width;
    dimension_t src_height;
    dimension_t dst_width;
    dimension_t dst_height;
    std::string pattern;
};

// Benchmark runner for a single mode and parallelism hint
BenchmarkStats benchmark_mode(interpolation_mode mode,
                              const pixel_buffer& input,
                              dimension_t out_width, dimension_t out_height,
                              std::size_t parallelism,
                              int warmup_runs, int bench_runs,
                              bool verbose) {
    BenchmarkStats stats;
    Timer timer;

    // Preallocated target so the timings exclude allocation
    pixel_buffer output(out_width, out_height, 3);

    for (int i = 0; i < warmup_runs; ++i) {
        unified_resampler::scale(input, output, mode, parallelism);
    }

    for (int i = 0; i < bench_runs; ++i) {
        timer.start();
        unified_resampler::scale(input, output, mode, parallelism);
        stats.add_sample(timer.elapsed_ms());

        if (verbose && (i + 1) % 10 == 0) {
            std::cout << "." << std::flush;
        }
    }

    return stats;
}

void print_header() {
    std::cout << std::left
              << std::setw(18) << "Mode"
              << std::right
              << std::setw(8) << "Threads"
              << std::setw(12) << "Mean (ms)"
              << std::setw(12) << "Min (ms)"
              << std::setw(12) << "Max (ms)"
              << std::setw(12) << "StdDev"
              << std::setw(12) << "MP/s"
              << std::endl;
    std::cout << std::string(86, '-') << std::endl;
}

void run_case(const BenchmarkCase& bench,
              const std::vector<interpolation_mode>& modes,
              const std::vector<std::size_t>& thread_counts,
              int warmup_runs, int bench_runs, bool verbose) {
    std::cout << "\n=== Benchmark: " << bench.description << " ===" << std::endl;
    std::cout << "Source: " << bench.src_width << "x" << bench.src_height
              << " (" << bench.pattern << ")  Target: "
              << bench.dst_width << "x" << bench.dst_height << std::endl;
    std::cout << "Warmup runs: " << warmup_runs << ", Benchmark runs: " << bench_runs << std::endl;

    const pixel_buffer input = create_test_image(bench.src_width, bench.src_height, bench.pattern);

    print_header();
    for (interpolation_mode mode : modes) {
        std::optional<double> serial_mean;
        for (std::size_t threads : thread_counts) {
            const BenchmarkStats stats = benchmark_mode(mode, input, bench.dst_width, bench.dst_height,
                                                        threads, warmup_runs, bench_runs, verbose);
            if (threads == 1) {
                serial_mean = stats.mean();
            }

            std::cout << std::left << std::setw(18) << mode_capabilities::get_mode_name(mode)
                      << std::right << std::setw(8) << (threads == 0 ? std::string("auto") : std::to_string(threads))
                      << std::fixed << std::setprecision(3)
                      << std::setw(12) << stats.mean()
                      << std::setw(12) << stats.min_time
                      << std::setw(12) << stats.max_time
                      << std::setw(12) << stats.stddev()
                      << std::setprecision(1)
                      << std::setw(12) << stats.throughput_mpps(bench.dst_width, bench.dst_height);
            if (serial_mean && threads != 1 && stats.mean() > 0.0) {
                std::cout << "  x" << std::setprecision(2) << (*serial_mean / stats.mean());
            }
            std::cout << std::endl;
        }
    }
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool quick = false;
    std::string filter_mode;
    std::vector<std::size_t> thread_counts = {1, 2, 4, 0};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") verbose = true;
        else if (arg == "-q" || arg == "--quick") quick = true;
        else if ((arg == "-f" || arg == "--filter") && i + 1 < argc) {
            filter_mode = argv[++i];
        }
        else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            thread_counts = {static_cast<std::size_t>(std::strtoul(argv[++i], nullptr, 10))};
        }
        else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -v, --verbose         Verbose output\n"
                      << "  -q, --quick           Quick benchmark (fewer runs)\n"
                      << "  -f, --filter MODE     Run only the given mode (e.g., Bicubic)\n"
                      << "  -t, --threads N       Run only with parallelism N (0 = all cores)\n"
                      << "  -h, --help            Show this help\n";
            return 0;
        }
        else {
            std::cerr << "Unknown option: " << arg << " (see --help)" << std::endl;
            return 1;
        }
    }

    std::vector<interpolation_mode> modes = mode_capabilities::get_all_modes();
    if (!filter_mode.empty()) {
        const auto parsed = mode_capabilities::parse_mode_name(filter_mode);
        if (!parsed) {
            std::cerr << "Unknown mode: " << filter_mode << std::endl;
            return 1;
        }
        modes = {*parsed};
    }

    const int warmup_runs = quick ? 1 : 3;
    const int bench_runs = quick ? 5 : 20;

    std::cout << "Resampler Benchmark" << std::endl;
    std::cout << "Default parallelism: " << default_parallelism() << std::endl;

    const std::vector<BenchmarkCase> cases = {
        {"2x enlarge, photo-like", 640, 480, 1280, 960, "gradient"},
        {"Odd-ratio enlarge, noise", 333, 251, 1024, 768, "random"},
        {"Shrink to thumbnail", 1920, 1080, 320, 180, "checkerboard"},
        {"Width only", 1024, 512, 1600, 512, "gradient"},
    };

    try {
        for (const auto& bench : cases) {
            run_case(bench, modes, thread_counts, warmup_runs, bench_runs, verbose);
        }
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
