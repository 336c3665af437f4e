/**
 * @file bench.cpp
 * @brief Performance benchmarks for dec128 decoding, formatting and ordering.
 *
 * Measures throughput over a fixed pseudo-random record set for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/dec128_bench              # Run with default 100 iterations
 *   ./build/dec128_bench 1000         # Run with custom iteration count
 */

#include <dec128/dec128.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace dec128;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t NUM_RECORDS = 4096;

/**
 * @brief Build canonical finite records with exponents near the bias.
 *
 * Every 64th record is an Infinity or NaN so the non-finite paths are hit.
 */
static std::vector<std::uint8_t> make_records(std::size_t count) {
    std::mt19937_64 rng(0x5EED);
    std::vector<std::uint8_t> data(count * NUM_BYTES);

    for (std::size_t i = 0; i < count; ++i) {
        std::uint8_t* record = &data[i * NUM_BYTES];
        std::uint64_t low = rng();
        std::uint64_t exponent = static_cast<std::uint64_t>(EXPONENT_BIAS - 40) + rng() % 60;
        std::uint64_t high = (exponent << 49) | (rng() & 0xFFFFULL);

        if (i % 64 == 0) {
            high = (i % 128 == 0) ? 0x7800000000000000ULL : 0x7C00000000000000ULL;
        }
        if (rng() & 1U) {
            high |= 0x8000000000000000ULL;
        }

        for (std::size_t b = 0; b < 8; ++b) {
            record[b] = static_cast<std::uint8_t>(high >> (56 - 8 * b));
            record[8 + b] = static_cast<std::uint8_t>(low >> (56 - 8 * b));
        }
    }

    return data;
}

static void report(const char* name, std::chrono::high_resolution_clock::time_point start,
                   std::chrono::high_resolution_clock::time_point end, int iterations) {
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_record_ns = per_iter_us * 1000.0 / static_cast<double>(NUM_RECORDS);

    std::printf("%-20s %10.2f µs/iter  %8.2f ns/rec  (%zu recs)\n", name, per_iter_us,
                per_record_ns, NUM_RECORDS);
}

static void bench_decode(const std::vector<std::uint8_t>& input, int iterations) {
    std::vector<Decimal128> output(NUM_RECORDS);
    std::size_t count = 0;

    // Warmup run
    if (decode_records(input.data(), input.size(), output.data(), output.size(), count) !=
        Error::Ok) {
        std::fprintf(stderr, "Error: decode_records failed\n");
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        decode_records(input.data(), input.size(), output.data(), output.size(), count);
    }
    auto end = std::chrono::high_resolution_clock::now();

    report("decode", start, end, iterations);
}

static void bench_format(const std::vector<Decimal128>& values, int iterations) {
    char buffer[MAX_STRING_LENGTH];
    std::size_t total = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        for (const auto& value : values) {
            total += format_into(value, buffer, sizeof(buffer));
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    report("format", start, end, iterations);
    std::printf("%-20s %zu chars\n", "", total / static_cast<std::size_t>(iterations));
}

static void bench_sort(const std::vector<Decimal128>& values, int iterations) {
    std::vector<Decimal128> work;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        work = values;
        std::sort(work.begin(), work.end());
    }
    auto end = std::chrono::high_resolution_clock::now();

    report("sort", start, end, iterations);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("dec128 Benchmarks (C++ Implementation)\n");
    std::printf("======================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Records: %zu (%zu bytes)\n\n", NUM_RECORDS, NUM_RECORDS * NUM_BYTES);

    auto input = make_records(NUM_RECORDS);

    std::vector<Decimal128> values(NUM_RECORDS);
    std::size_t count = 0;
    if (decode_records(input.data(), input.size(), values.data(), values.size(), count) !=
        Error::Ok) {
        std::fprintf(stderr, "Error: Cannot decode benchmark records\n");
        return 1;
    }

    bench_decode(input, iterations);
    bench_format(values, iterations);
    bench_sort(values, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
