// benchmark.cpp
#include "lww_register.hpp"

#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace lww_crdt;

using Register = LWWRegister<std::string>;

class RegisterBenchmark {
public:
  explicit RegisterBenchmark(size_t replica_count) {
    replicas.reserve(replica_count);
    for (size_t i = 0; i < replica_count; ++i) {
      replicas.emplace_back("initial");
    }
  }

  void runBenchmark() {
    std::cout << "Starting LWWRegister Benchmark..." << std::endl;

    writeReplicas(std::chrono::seconds(2));
    mergeReplicas();
    serializeReplicas();

    std::cout << "LWWRegister Benchmark completed." << std::endl;
  }

private:
  std::vector<Register> replicas;

  void writeReplicas(std::chrono::seconds duration) {
    std::cout << "Writing to " << replicas.size() << " replicas for " << duration.count() << " seconds..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    size_t writes = 0;
    std::default_random_engine rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, replicas.size() - 1);

    while (std::chrono::high_resolution_clock::now() - start < duration) {
      replicas[dist(rng)].set_value("value_" + std::to_string(writes));
      writes++;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Performed " << writes << " writes in " << elapsed_ms << " ms." << std::endl;
  }

  void mergeReplicas() {
    std::cout << "Merging every replica into every other replica..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<Register> merged = replicas;
    size_t merges = 0;
    for (auto &target : merged) {
      for (const auto &source : replicas) {
        target.merge(source);
        merges++;
      }
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Performed " << merges << " merges in " << duration_ms << " ms." << std::endl;

    verifyConsistency(merged);
  }

  void serializeReplicas() {
    std::cout << "Serializing and restoring " << replicas.size() << " replicas..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    size_t bytes = 0;
    size_t failures = 0;
    for (const auto &replica : replicas) {
      auto encoded = replica.serialize();
      bytes += encoded.size();
      auto decoded = Register::deserialize(encoded);
      if (!decoded || !(*decoded == replica)) {
        failures++;
      }
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Encoded " << bytes << " bytes in " << duration_ms << " ms, " << failures << " failures." << std::endl;
  }

  void verifyConsistency(const std::vector<Register> &merged) const {
    std::cout << "Verifying consistency between replicas..." << std::endl;

    bool consistent = true;
    for (const auto &replica : merged) {
      if (!(replica == merged.front())) {
        consistent = false;
        break;
      }
    }

    if (consistent) {
      std::cout << "Consistency check passed: all replicas hold " << merged.front() << std::endl;
    } else {
      std::cout << "Consistency check failed: replicas have differing state." << std::endl;
    }
  }
};

// Entry point for the benchmark
int main() {
  RegisterBenchmark benchmark(512);
  benchmark.runBenchmark();

  return 0;
}
