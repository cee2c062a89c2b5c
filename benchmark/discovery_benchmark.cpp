#include "regwire/core/catalog_loader.hpp"
#include "regwire/core/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

struct benchmark_result {
    std::string name;
    double throughput;
    double latency_p50;
    double latency_p99;
    double latency_p999;
    uint64_t operations;
    uint64_t duration_ms;
    uint64_t errors;
};

void print_result(const benchmark_result& result) {
    std::cout << "\n=== " << result.name << " ===\n";
    std::cout << "Operations: " << result.operations << "\n";
    std::cout << "Duration: " << result.duration_ms << " ms\n";
    std::cout << "Throughput: " << std::fixed << std::setprecision(2) << result.throughput
              << " ops/sec\n";
    std::cout << "Errors: " << result.errors << "\n";
    if (result.latency_p50 > 0.0) {
        std::cout << "Latency p50: " << std::fixed << std::setprecision(3) << result.latency_p50
                  << " us\n";
        std::cout << "Latency p99: " << std::fixed << std::setprecision(3) << result.latency_p99
                  << " us\n";
        std::cout << "Latency p999: " << std::fixed << std::setprecision(3) << result.latency_p999
                  << " us\n";
    }
}

// Contract, one abstract base and `handlers` concrete classes. Every fourth
// handler reaches the contract through the abstract base, every tenth is a
// closed generic.
std::string make_catalog(size_t handlers) {
    std::ostringstream os;
    os << R"({"catalog":"1","types":[)";
    os << R"({"name":"regwire::request_handler","kind":"interface","type_parameters":["TInput","TOutput"]},)";
    os << R"({"name":"app::base_handler","abstract":true,"bases":["regwire::request_handler<app::audit, bool>"]},)";
    os << R"({"name":"app::box_handler","type_parameters":["T"],"bases":["regwire::request_handler<app::box<T>, T>"]})";
    for (size_t i = 0; i < handlers; ++i) {
        os << ",{\"name\":\"app::handlers::handler_" << i << "\"";
        if (i % 10 == 9) {
            os << ",\"type_parameters\":[\"T\"],\"type_arguments\":[\"std::vector<int>\"]"
               << ",\"bases\":[\"regwire::request_handler<app::request_" << i << "<T>, T>\"]}";
        } else if (i % 4 == 3) {
            os << ",\"bases\":[\"app::base_handler\"]}";
        } else {
            os << ",\"bases\":[{\"type\":\"regwire::request_handler<app::request_" << i
               << ", std::optional<app::response_" << i << ">>\",\"location\":{\"file\":\"handlers_"
               << i / 100 << ".hpp\",\"line\":" << (i % 100) * 12 + 3 << ",\"column\":30}}]}";
        }
    }
    os << "]}";
    return os.str();
}

template <typename Fn>
benchmark_result run_benchmark(const std::string& name, uint64_t iterations, Fn&& fn) {
    std::vector<double> latencies;
    latencies.reserve(iterations);

    uint64_t errors = 0;
    auto start = std::chrono::steady_clock::now();

    for (uint64_t i = 0; i < iterations; ++i) {
        auto iter_start = std::chrono::steady_clock::now();
        bool ok = fn();
        auto iter_end = std::chrono::steady_clock::now();

        if (!ok) {
            ++errors;
        }

        auto latency_us =
            std::chrono::duration_cast<std::chrono::microseconds>(iter_end - iter_start).count();
        latencies.push_back(static_cast<double>(latency_us));
    }

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::sort(latencies.begin(), latencies.end());

    benchmark_result result;
    result.name = name;
    result.operations = iterations;
    result.errors = errors;
    result.duration_ms = static_cast<uint64_t>(duration_ms);
    result.throughput = static_cast<double>(iterations) /
                        (static_cast<double>(std::max<int64_t>(duration_ms, 1)) / 1000.0);
    result.latency_p50 = latencies[latencies.size() / 2];
    result.latency_p99 = latencies[latencies.size() * 99 / 100];
    result.latency_p999 = latencies[latencies.size() * 999 / 1000];

    return result;
}

int main() {
    std::cout << "Handler Discovery Benchmark\n";
    std::cout << "===========================\n";

    for (size_t handlers : {100UL, 1000UL, 10000UL}) {
        const std::string text = make_catalog(handlers);
        const uint64_t iterations = handlers >= 10000 ? 20 : 200;

        print_result(run_benchmark("Catalog load (" + std::to_string(handlers) + " handlers)",
                                   iterations,
                                   [&] { return regwire::catalog_io::load_from_string(text).has_value(); }));

        auto cat = regwire::catalog_io::load_from_string(text);
        if (!cat) {
            std::cerr << "[bench] catalog failed to load: " << cat.error().message() << "\n";
            return 1;
        }

        regwire::pipeline_options opts;
        print_result(run_benchmark("Discovery + emit (" + std::to_string(handlers) + " handlers)",
                                   iterations,
                                   [&] {
                                       auto out = regwire::run_pipeline(*cat, opts);
                                       return out && out->unit.has_value();
                                   }));
    }

    std::cout << "\n";
    return 0;
}
