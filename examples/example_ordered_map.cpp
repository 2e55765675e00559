// Copyright 2025-2026 ocmap contributors

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ordered_map.hpp"

namespace {

using job_results = ocmap::concurrent_ordered_map<std::uint64_t, std::string>;

constexpr std::size_t n_workers = 4;
constexpr std::uint64_t n_jobs = 20;

// Workers take every n_workers-th job and record its result keyed by
// the job number.  Results arrive out of order, the summary comes out
// in job order.
void run_worker(job_results &results, std::size_t worker_i) {
  for (auto job = static_cast<std::uint64_t>(worker_i); job < n_jobs;
       job += n_workers) {
    results.store(job, "worker " + std::to_string(worker_i) + ": " +
                           std::to_string(job * job));
  }
  // Every worker tries to claim the follow-up job; only one wins.
  const auto claim = results.load_or_store(
      n_jobs, "follow-up by worker " + std::to_string(worker_i));
  if (!claim.second)
    std::cout << "worker " << worker_i << " claimed the follow-up\n";
}

}  // namespace

int main() {
  job_results results;

  std::vector<std::thread> workers;
  workers.reserve(n_workers);
  for (std::size_t i = 0; i < n_workers; ++i)
    workers.emplace_back(run_worker, std::ref(results), i);
  for (auto &t : workers) t.join();

  const auto follow_up = results.load_and_remove(n_jobs);
  if (follow_up) std::cout << *follow_up << '\n';

  std::cout << results.size() << " job results in job order:\n";
  results.range([](const std::uint64_t &job, const std::string &result) {
    std::cout << "  job " << job << " -> " << result << '\n';
    return true;
  });

  std::cout << "last three jobs:\n";
  results.scan(
      [n = 0](job_results::visitor &v) mutable {
        std::cout << "  job " << v.get_key() << '\n';
        return ++n == 3;
      },
      false);

  results.dump(std::cout);
  return 0;
}
